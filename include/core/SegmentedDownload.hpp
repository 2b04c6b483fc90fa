#ifndef SEGMENTEDDOWNLOAD_HPP
#define SEGMENTEDDOWNLOAD_HPP

#include <map>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>

#include "core/Target.hpp"
#include "core/Segment.hpp"
#include "core/RangePlanner.hpp"
#include "core/ProgressLedger.hpp"
#include "core/StateStore.hpp"
#include "util/HttpClient.hpp"
#include "aux/CancellationToken.hpp"

enum class CoordinatorState
{
    IDLE,
    PLANNING,
    TRANSFERRING,
    MERGING,
    DONE,
    PAUSED
};

enum class DownloadOutcome
{
    COMPLETED,  // Artifact merged, segment files and state record removed
    PAUSED,     // Interrupted; state persisted and segment files kept for reinstate()
    INCOMPLETE  // Some segment failed; state persisted and segment files kept for reinstate()
};

struct SegmentProgress
{
    int id{0};
    SegmentState state{SegmentState::PENDING};
    ByteOffset bytesDone{0};
    ByteOffset bytesTotal{0};
};

// Drives one target through planning, concurrent segment transfer, and merge or pause
class SegmentedDownload
{
public:
    // Derives the file name and probes the resource size.
    // Throws DownloadError(INVALID_CONFIGURATION) or DownloadError(NETWORK) before anything is transferred.
    SegmentedDownload(HttpClient &client,
                      StateStore &store,
                      const std::string &url,
                      int segmentCount,
                      const std::string &outputDirectory = "");

    // Fresh start: plans every segment and fetches it from scratch.
    // Throws DownloadError(MERGE) if the segments cannot be assembled.
    DownloadOutcome download();

    // Resume: fetches only the segments the state record lists as incomplete
    DownloadOutcome reinstate();

    // Asks every worker to stop at its next progress callback; safe from any thread
    void interrupt();

    const Target &getTarget() const { return _target; }
    CoordinatorState getState() const { return _state.load(); }
    bool isInterrupted() const { return _cancel.isCancelled(); }
    bool persistFailed() const { return _persistFailed.load(); }
    ByteOffset getPartitionSize() const { return _planner.getPartitionSize(); }

    const ProgressLedger &getLedger() const { return _ledger; }
    std::vector<SegmentProgress> getProgress() const;
    std::map<int, SegmentResult> getResults() const;

    std::string segmentFilePath(int segmentId) const;
    std::string artifactPath() const;

private:
    HttpClient &_client;
    StateStore &_store;
    std::string _outputDirectory;
    Target _target;
    RangePlanner _planner;
    ProgressLedger _ledger;
    CancellationToken _cancel;
    std::atomic<CoordinatorState> _state{CoordinatorState::IDLE};
    std::atomic<bool> _persistFailed{false};
    int _attempts{0};

    mutable std::mutex _mutex;
    bool _resume{false};
    std::vector<Segment> _segments;
    std::map<int, ByteOffset> _lastOffsets;
    std::map<int, SegmentResult> _results;

    DownloadOutcome run(bool resume);
    std::vector<Segment> resumeSegments();
    DownloadOutcome transfer(const std::vector<Segment> &segments, bool resume);
    DownloadOutcome merge();
    void onAllTerminal(const LedgerSnapshot &snapshot, bool resume);
    bool allSegmentFilesPresent() const;
};

const char *coordinatorStateToString(CoordinatorState state);
const char *downloadOutcomeToString(DownloadOutcome outcome);

#endif
