#include <algorithm>

#include <spdlog/spdlog.h>

#include "core/TransferWorker.hpp"
#include "aux/FileWriter.hpp"

TransferWorker::TransferWorker(HttpClient &client,
                               ProgressLedger &ledger,
                               const CancellationToken &cancel,
                               const std::string &url,
                               const std::string &segmentFilePath,
                               ByteOffset totalSize,
                               bool appendToSegmentFile)
    : _client(client),
      _ledger(ledger),
      _cancel(cancel),
      _url(url),
      _segmentFilePath(segmentFilePath),
      _totalSize(totalSize),
      _appendToSegmentFile(appendToSegmentFile)
{
}

ByteOffset TransferWorker::expectedBytes(ByteOffset rangeStart, ByteOffset rangeEnd, ByteOffset totalSize)
{
    // The last planned range may end past the final byte; the server clamps it
    ByteOffset lastByte = std::min(rangeEnd, totalSize - 1);
    return std::max<ByteOffset>(lastByte - rangeStart + 1, 0);
}

SegmentResult TransferWorker::run(const Segment &segment,
                                  ByteOffset rangeStart,
                                  ByteOffset rangeEnd,
                                  ByteOffset attemptOffset)
{
    const int id = segment.id;
    const ByteOffset expected = expectedBytes(rangeStart, rangeEnd, _totalSize);

    _ledger.markInProgress(id);

    if (expected == 0)
    {
        spdlog::info("Segment {} has nothing left to fetch", id);
        return finish(id, SegmentState::COMPLETE, "");
    }

    // Open file (append if resuming, otherwise overwrite)
    FileWriter writer(_segmentFilePath, _appendToSegmentFile);
    if (!writer.isOpen())
    {
        return finish(id, SegmentState::INCOMPLETE, "cannot open " + _segmentFilePath);
    }

    spdlog::info("Segment {} fetching bytes {}-{} from offset {} into {}",
                 id, rangeStart, rangeEnd, attemptOffset, _segmentFilePath);

    // A server that ignores the range sends the resource from byte 0; only the requested
    // bytes are kept and the transfer is stopped at the end of the range
    auto sink = [&writer, expected](const char *data, size_t size)
    {
        ByteOffset room = expected - writer.getBytesWritten();
        if (static_cast<ByteOffset>(size) <= room)
        {
            return writer.write(data, size);
        }

        if (room > 0)
        {
            writer.write(data, static_cast<size_t>(room));
        }
        return false;
    };

    auto onProgress = [this, &writer, id, expected](ByteOffset transferred, ByteOffset /* totalExpected */)
    {
        _ledger.reportProgress(id, transferred);

        // Completion is reported as soon as the last byte is on disk, before the transfer returns
        if (transferred != 0 && transferred >= expected)
        {
            if (!writer.flush())
            {
                return false;
            }
            _ledger.reportTerminal(id, SegmentState::COMPLETE);
        }

        return !_cancel.isCancelled();
    };

    HttpResult result = _client.fetchRange(_url, rangeStart, rangeEnd, sink, onProgress, _cancel);

    bool closed = writer.close();
    ByteOffset written = writer.getBytesWritten();
    _ledger.reportProgress(id, written);

    if (written >= expected && closed)
    {
        return finish(id, SegmentState::COMPLETE, "");
    }

    std::string reason;
    if (!closed)
    {
        reason = "failed writing " + _segmentFilePath;
    }
    else if (_cancel.isCancelled())
    {
        reason = "interrupted";
    }
    else if (!result.ok())
    {
        reason = result.getErrorMessage();
    }
    else
    {
        reason = "transfer ended early";
    }

    reason += " after " + std::to_string(written) + " of " + std::to_string(expected) + " bytes";
    return finish(id, SegmentState::INCOMPLETE, reason);
}

// Reports the terminal state and returns what the ledger settled on (the first report wins)
SegmentResult TransferWorker::finish(int segmentId, SegmentState state, const std::string &reason)
{
    _ledger.reportTerminal(segmentId, state);

    SegmentResult result;
    result.state = _ledger.getState(segmentId);
    if (!result.isComplete())
    {
        result.state = SegmentState::INCOMPLETE;
        result.reason = reason;
        spdlog::warn("Segment {} incomplete: {}", segmentId, reason);
    }
    else
    {
        spdlog::info("Segment {} complete", segmentId);
    }

    return result;
}
