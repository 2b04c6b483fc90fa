#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/SegmentAssembler.hpp"
#include "core/DownloadError.hpp"
#include "aux/FileWriter.hpp"
#include "util/file.hpp"

namespace
{
    constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;
}

SegmentAssembler::SegmentAssembler(const std::string &artifactPath)
    : _artifactPath(artifactPath)
{
}

void SegmentAssembler::assemble(const std::vector<std::string> &partPaths) const
{
    const std::string tempPath = getTemporaryPath();
    ByteOffset total = 0;

    {
        FileWriter out(tempPath, false);
        if (!out.isOpen())
        {
            fail("cannot create " + tempPath);
        }

        std::vector<char> buffer(COPY_BUFFER_SIZE);
        for (const auto &partPath : partPaths)
        {
            std::ifstream in(partPath, std::ios::binary);
            if (!in.is_open())
            {
                out.close();
                fail("cannot read segment file " + partPath);
            }

            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize count = in.gcount();
                if (count > 0 && !out.write(buffer.data(), static_cast<size_t>(count)))
                {
                    out.close();
                    fail("failed writing " + tempPath);
                }
            }

            if (in.bad())
            {
                out.close();
                fail("failed reading segment file " + partPath);
            }
        }

        total = out.getBytesWritten();
        if (!out.close())
        {
            fail("failed writing " + tempPath);
        }
    }

    if (!renameFile(tempPath, _artifactPath))
    {
        fail("cannot move " + tempPath + " to " + _artifactPath);
    }

    // Parts go only once the artifact is in place
    for (const auto &partPath : partPaths)
    {
        if (!removeFile(partPath))
        {
            spdlog::warn("Could not remove segment file {}", partPath);
        }
    }

    spdlog::info("Merged {} segments into {} ({} bytes)", partPaths.size(), _artifactPath, total);
}

void SegmentAssembler::fail(const std::string &message) const
{
    removeFile(getTemporaryPath());
    throw DownloadError(ErrorKind::MERGE, message);
}
