#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

#include "core/SegmentedDownload.hpp"
#include "core/DownloadError.hpp"
#include "core/SegmentAssembler.hpp"
#include "core/TransferWorker.hpp"
#include "aux/WorkerGroup.hpp"
#include "util/file.hpp"
#include "util/http.hpp"

namespace
{
    // Validates the request and asks the server for the resource size
    Target resolveTarget(HttpClient &client, const std::string &url, int segmentCount)
    {
        if (segmentCount <= 0)
        {
            throw DownloadError(ErrorKind::INVALID_CONFIGURATION,
                                "segment count must be positive, got " + std::to_string(segmentCount));
        }

        Target target;
        target.url = url;
        target.segmentCount = segmentCount;
        target.fileName = http::deriveFilenameFromUrl(url);
        if (target.fileName.empty())
        {
            throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "cannot derive a file name from " + url);
        }

        ResourceInfo info;
        HttpResult result = client.probeLength(url, info);
        if (!result.ok())
        {
            throw DownloadError(ErrorKind::NETWORK, "size probe of " + url + " failed: " + result.getErrorMessage());
        }

        if (info.length <= 0)
        {
            throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "server did not report the size of " + url);
        }

        if (!info.acceptsRanges)
        {
            spdlog::warn("{} does not advertise byte-range support", url);
        }

        target.totalSize = info.length;
        return target;
    }
}

SegmentedDownload::SegmentedDownload(HttpClient &client,
                                     StateStore &store,
                                     const std::string &url,
                                     int segmentCount,
                                     const std::string &outputDirectory)
    : _client(client),
      _store(store),
      _outputDirectory(outputDirectory),
      _target(resolveTarget(client, url, segmentCount)),
      _planner(_target.totalSize, _target.segmentCount)
{
    if (!ensureDirectory(_outputDirectory))
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "cannot create output directory " + _outputDirectory);
    }

    spdlog::info("Target {} ({} bytes, {} segments of {} bytes)",
                 _target.fileName, _target.totalSize, _target.segmentCount, _planner.getPartitionSize());
}

DownloadOutcome SegmentedDownload::download()
{
    return run(false);
}

DownloadOutcome SegmentedDownload::reinstate()
{
    return run(true);
}

void SegmentedDownload::interrupt()
{
    spdlog::info("Interrupt requested for {}", _target.fileName);
    _cancel.requestCancel();
}

DownloadOutcome SegmentedDownload::run(bool resume)
{
    // A stop requested before the first attempt still applies to it
    if (_attempts++ > 0)
    {
        _cancel.reset();
    }
    _persistFailed.store(false);
    _state.store(CoordinatorState::PLANNING);

    std::vector<Segment> segments;
    if (resume)
    {
        segments = resumeSegments();
        if (segments.empty())
        {
            if (_store.hasRecord(_target.fileName) && allSegmentFilesPresent())
            {
                spdlog::info("Every segment of {} is already complete", _target.fileName);
                return merge();
            }

            spdlog::info("No resumable state for {}, starting a fresh download", _target.fileName);
            resume = false;
        }
    }

    if (!resume)
    {
        segments = _planner.plan();
    }

    return transfer(segments, resume);
}

// Rebuilds the attempt from the state record; each segment restarts at its recorded offset
std::vector<Segment> SegmentedDownload::resumeSegments()
{
    std::vector<StateEntry> entries = _store.loadEntries(_target.fileName);

    // Every attempt records all of its segments, so a usable record names exactly 1..N
    std::set<int> ids;
    for (const auto &entry : entries)
    {
        ids.insert(entry.segmentId);
    }

    bool matches = ids.empty() ||
                   (static_cast<int>(ids.size()) == _target.segmentCount && entries.size() == ids.size() &&
                    *ids.begin() == 1 && *ids.rbegin() == _target.segmentCount);
    if (!matches)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION,
                            "state record of " + _target.fileName + " was saved with " +
                                std::to_string(ids.size()) + " segments but " +
                                std::to_string(_target.segmentCount) +
                                " were requested; resume with the original segment count or restart");
    }

    std::vector<Segment> segments;
    for (const auto &range : _store.loadIncomplete(_target.fileName))
    {
        Segment segment;
        segment.id = range.segmentId;
        segment.start = range.start;
        segment.end = range.end;
        segment.lastOffset = range.start;

        ByteOffset onDisk = getFileSize(segmentFilePath(segment.id));
        ByteOffset recorded = range.start - _planner.plannedStart(segment.id);
        if (onDisk != recorded && !(onDisk < 0 && recorded == 0))
        {
            spdlog::warn("Segment file {} holds {} bytes but the state record expects {}",
                         segmentFilePath(segment.id), onDisk, recorded);
        }

        segments.push_back(segment);
    }

    return segments;
}

DownloadOutcome SegmentedDownload::transfer(const std::vector<Segment> &segments, bool resume)
{
    std::vector<int> ids;
    {
        std::lock_guard<std::mutex> lock(_mutex);

        _resume = resume;
        _segments = segments;
        _results.clear();
        _lastOffsets.clear();
        for (const auto &segment : segments)
        {
            ids.push_back(segment.id);
            _lastOffsets[segment.id] = segment.lastOffset;
        }
    }

    // The worker whose terminal report settles the last segment persists the attempt
    _ledger.reset(ids, [this, resume](const LedgerSnapshot &snapshot)
                  { onAllTerminal(snapshot, resume); });

    _state.store(CoordinatorState::TRANSFERRING);
    spdlog::info("{} {} with {} workers", resume ? "Resuming" : "Downloading", _target.fileName, segments.size());

    {
        WorkerGroup workers;
        for (const auto &segment : segments)
        {
            workers.spawn([this, segment, resume]()
                          {
                              TransferWorker worker(_client, _ledger, _cancel, _target.url,
                                                    segmentFilePath(segment.id), _target.totalSize, resume);
                              SegmentResult result = worker.run(segment, segment.start, segment.end, segment.lastOffset);

                              std::lock_guard<std::mutex> lock(_mutex);
                              _results[segment.id] = result;
                          });
        }
        workers.joinAll();
    }

    if (_cancel.isCancelled())
    {
        _state.store(CoordinatorState::PAUSED);
        spdlog::info("Paused {}; segment files kept for a later resume", _target.fileName);
        return DownloadOutcome::PAUSED;
    }

    if (!_ledger.allComplete())
    {
        _state.store(CoordinatorState::IDLE);
        spdlog::warn("{} has incomplete segments; run again to resume", _target.fileName);
        return DownloadOutcome::INCOMPLETE;
    }

    return merge();
}

DownloadOutcome SegmentedDownload::merge()
{
    _state.store(CoordinatorState::MERGING);

    std::vector<std::string> parts;
    for (int id = 1; id <= _target.segmentCount; ++id)
    {
        parts.push_back(segmentFilePath(id));
    }

    try
    {
        SegmentAssembler(artifactPath()).assemble(parts);
    }
    catch (const DownloadError &)
    {
        _state.store(CoordinatorState::IDLE);
        throw;
    }

    try
    {
        _store.erase(_target.fileName);
    }
    catch (const DownloadError &e)
    {
        spdlog::error("Could not clear saved state of {}: {}", _target.fileName, e.what());
    }

    _state.store(CoordinatorState::DONE);
    return DownloadOutcome::COMPLETED;
}

// Loss of the record only affects later resumes, so failures are logged rather than thrown
void SegmentedDownload::onAllTerminal(const LedgerSnapshot &snapshot, bool resume)
{
    std::map<int, ByteOffset> lastOffsets;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        lastOffsets = _lastOffsets;
    }

    try
    {
        _store.persist(_target.fileName, snapshot, lastOffsets, _planner.getPartitionSize(), resume);
    }
    catch (const DownloadError &e)
    {
        _persistFailed.store(true);
        spdlog::error("Could not save state of {}: {}", _target.fileName, e.what());
    }
}

bool SegmentedDownload::allSegmentFilesPresent() const
{
    for (int id = 1; id <= _target.segmentCount; ++id)
    {
        if (!fileExists(segmentFilePath(id)))
            return false;
    }

    return true;
}

std::vector<SegmentProgress> SegmentedDownload::getProgress() const
{
    std::vector<Segment> segments;
    bool resume = false;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        segments = _segments;
        resume = _resume;
    }

    std::vector<SegmentProgress> progress;
    for (int id = 1; id <= _target.segmentCount; ++id)
    {
        SegmentProgress entry;
        entry.id = id;
        entry.bytesTotal = TransferWorker::expectedBytes(_planner.plannedStart(id), _planner.plannedEnd(id), _target.totalSize);

        auto it = std::find_if(segments.begin(), segments.end(), [id](const Segment &s)
                               { return s.id == id; });
        if (it == segments.end())
        {
            // Not part of a resumed attempt: finished earlier
            if (resume)
            {
                entry.state = SegmentState::COMPLETE;
                entry.bytesDone = entry.bytesTotal;
            }
        }
        else
        {
            ByteOffset carried = resume ? it->start - _planner.plannedStart(id) : 0;
            entry.state = _ledger.getState(id);
            entry.bytesDone = std::min(std::max<ByteOffset>(carried + _ledger.getPosition(id), 0), entry.bytesTotal);
        }

        progress.push_back(entry);
    }

    return progress;
}

std::map<int, SegmentResult> SegmentedDownload::getResults() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _results;
}

std::string SegmentedDownload::segmentFilePath(int segmentId) const
{
    return joinPath(_outputDirectory, _target.fileName + "." + std::to_string(segmentId) + ".part");
}

std::string SegmentedDownload::artifactPath() const
{
    return joinPath(_outputDirectory, _target.fileName);
}

const char *coordinatorStateToString(CoordinatorState state)
{
    switch (state)
    {
    case CoordinatorState::IDLE:
        return "idle";
    case CoordinatorState::PLANNING:
        return "planning";
    case CoordinatorState::TRANSFERRING:
        return "transferring";
    case CoordinatorState::MERGING:
        return "merging";
    case CoordinatorState::DONE:
        return "done";
    case CoordinatorState::PAUSED:
        return "paused";
    }

    return "unknown";
}

const char *downloadOutcomeToString(DownloadOutcome outcome)
{
    switch (outcome)
    {
    case DownloadOutcome::COMPLETED:
        return "completed";
    case DownloadOutcome::PAUSED:
        return "paused";
    case DownloadOutcome::INCOMPLETE:
        return "incomplete";
    }

    return "unknown";
}
