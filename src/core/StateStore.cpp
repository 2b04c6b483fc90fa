#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/StateStore.hpp"
#include "core/DownloadError.hpp"
#include "util/file.hpp"

StateStore::StateStore(const std::string &stateFilePath)
    : _stateFilePath(stateFilePath)
{
}

// Only segments recorded as incomplete are eligible for a resumed attempt
std::vector<ResumeRange> StateStore::loadIncomplete(const std::string &fileName) const
{
    std::vector<ResumeRange> ranges;

    for (const auto &entry : loadEntries(fileName))
    {
        if (entry.state == SegmentState::INCOMPLETE)
        {
            ranges.push_back({entry.segmentId, entry.start, entry.end});
        }
    }

    return ranges;
}

std::vector<StateEntry> StateStore::loadEntries(const std::string &fileName) const
{
    std::lock_guard<std::mutex> lock(_mutex);

    Records records = readRecords();
    auto it = records.find(fileName);
    if (it == records.end())
    {
        return {};
    }

    return it->second;
}

bool StateStore::hasRecord(const std::string &fileName) const
{
    return !loadEntries(fileName).empty();
}

void StateStore::persist(const std::string &fileName,
                         const LedgerSnapshot &snapshot,
                         const std::map<int, ByteOffset> &lastConfirmedOffsets,
                         ByteOffset partitionSize,
                         bool isResume)
{
    std::vector<StateEntry> entries;

    for (const auto &state : snapshot.states)
    {
        int id = state.first;

        auto position = snapshot.positions.find(id);
        auto lastOffset = lastConfirmedOffsets.find(id);

        StateEntry entry;
        entry.segmentId = id;
        entry.state = state.second == SegmentState::COMPLETE ? SegmentState::COMPLETE : SegmentState::INCOMPLETE;

        // Position reached by this attempt, on top of where the previous attempt stopped
        entry.start = (position != snapshot.positions.end() ? position->second : 0) +
                      (lastOffset != lastConfirmedOffsets.end() ? lastOffset->second : 0);

        // A fresh attempt counts from the planned start of the segment
        if (!isResume)
        {
            entry.start += partitionSize * (id - 1);
            entry.start += id != 1 ? 1 : 0;
        }

        // Cancels the +1 of the inclusive planned start so a complete range never runs past its end
        if (entry.state == SegmentState::COMPLETE)
        {
            entry.start -= 1;
        }

        entry.end = partitionSize * id;
        entries.push_back(entry);
    }

    std::lock_guard<std::mutex> lock(_mutex);

    Records records = readRecords();

    // Segments finished by earlier attempts are not part of a resumed attempt; keep their lines
    if (isResume)
    {
        for (const auto &previous : records[fileName])
        {
            if (snapshot.states.find(previous.segmentId) == snapshot.states.end())
            {
                entries.push_back(previous);
            }
        }
    }

    std::sort(entries.begin(), entries.end(), [](const StateEntry &a, const StateEntry &b)
              { return a.segmentId < b.segmentId; });

    records[fileName] = std::move(entries);
    writeRecords(records);

    spdlog::info("Saved state of {} ({} segments) to {}", fileName, records[fileName].size(), _stateFilePath);
}

void StateStore::erase(const std::string &fileName)
{
    std::lock_guard<std::mutex> lock(_mutex);

    Records records = readRecords();
    if (records.erase(fileName) == 0)
    {
        return;
    }

    writeRecords(records);
}

std::string StateStore::formatRange(ByteOffset start, ByteOffset end)
{
    return std::to_string(start) + "-" + std::to_string(end);
}

bool StateStore::parseRange(const std::string &descriptor, ByteOffset &start, ByteOffset &end)
{
    // The first '-' after the first digit separates the bounds
    auto dashPos = descriptor.find('-', 1);
    if (dashPos == std::string::npos)
    {
        return false;
    }

    try
    {
        size_t consumed = 0;
        std::string first = descriptor.substr(0, dashPos);
        std::string second = descriptor.substr(dashPos + 1);

        start = std::stoll(first, &consumed);
        if (consumed != first.size())
            return false;

        end = std::stoll(second, &consumed);
        if (consumed != second.size())
            return false;
    }
    catch (const std::logic_error &)
    {
        // std::invalid_argument or std::out_of_range from stoll
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------
// Reading and writing the state file
//------------------------------------------------------------------------------

StateStore::Records StateStore::readRecords() const
{
    Records records;

    std::ifstream inFile(_stateFilePath);
    if (!inFile.is_open())
    {
        return records; // No file => no records
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(inFile, line))
    {
        ++lineNumber;
        if (line.empty())
            continue;

        std::istringstream iss(line);

        std::string fileName, stateText, rangeText;
        int segmentId = 0;

        StateEntry entry;
        if (!(iss >> std::quoted(fileName) >> segmentId >> stateText >> std::quoted(rangeText)) ||
            !segmentStateFromString(stateText, entry.state) ||
            !parseRange(rangeText, entry.start, entry.end))
        {
            spdlog::warn("Skipping malformed line {} of {}", lineNumber, _stateFilePath);
            continue;
        }

        entry.segmentId = segmentId;
        records[fileName].push_back(entry);
    }

    return records;
}

// Writes next to the state file and renames it into place so a crash never leaves a torn record
void StateStore::writeRecords(const Records &records) const
{
    std::string directory = parentDirectory(_stateFilePath);
    if (!ensureDirectory(directory))
    {
        throw DownloadError(ErrorKind::PERSISTENCE, "cannot create state directory " + directory);
    }

    std::string tempPath = _stateFilePath + ".tmp";
    {
        std::ofstream outFile(tempPath, std::ios::out | std::ios::trunc);
        if (!outFile.is_open())
        {
            throw DownloadError(ErrorKind::PERSISTENCE, "cannot open " + tempPath + " for writing");
        }

        for (const auto &record : records)
        {
            for (const auto &entry : record.second)
            {
                outFile << std::quoted(record.first) << " "
                        << entry.segmentId << " "
                        << segmentStateToString(entry.state) << " "
                        << std::quoted(formatRange(entry.start, entry.end)) << "\n";
            }
        }

        outFile.flush();
        if (!outFile)
        {
            outFile.close();
            removeFile(tempPath);
            throw DownloadError(ErrorKind::PERSISTENCE, "failed writing " + tempPath);
        }
    }

    if (!renameFile(tempPath, _stateFilePath))
    {
        removeFile(tempPath);
        throw DownloadError(ErrorKind::PERSISTENCE, "cannot replace " + _stateFilePath);
    }
}
