#ifndef STATESTORE_HPP
#define STATESTORE_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/Segment.hpp"
#include "core/ProgressLedger.hpp"

// A range to fetch for a segment left incomplete by an earlier attempt
struct ResumeRange
{
    int segmentId{0};
    ByteOffset start{0};
    ByteOffset end{0};
};

// One persisted segment line
struct StateEntry
{
    int segmentId{0};
    SegmentState state{SegmentState::INCOMPLETE};
    ByteOffset start{0};
    ByteOffset end{0};
};

// Durable, file-name-keyed record of segment states. The file holds one line per segment:
//   "<file name>" <segment id> <complete|incomplete> "<start>-<end>"
// Records of different file names share the file without interfering.
class StateStore
{
public:
    explicit StateStore(const std::string &stateFilePath);

    std::vector<ResumeRange> loadIncomplete(const std::string &fileName) const;
    std::vector<StateEntry> loadEntries(const std::string &fileName) const;
    bool hasRecord(const std::string &fileName) const;

    // Rewrites the record of fileName from a finished attempt.
    // Throws DownloadError(PERSISTENCE) if the state file cannot be written.
    void persist(const std::string &fileName,
                 const LedgerSnapshot &snapshot,
                 const std::map<int, ByteOffset> &lastConfirmedOffsets,
                 ByteOffset partitionSize,
                 bool isResume);

    void erase(const std::string &fileName);

    const std::string &getStateFilePath() const { return _stateFilePath; }

    static std::string formatRange(ByteOffset start, ByteOffset end);
    static bool parseRange(const std::string &descriptor, ByteOffset &start, ByteOffset &end);

private:
    using Records = std::map<std::string, std::vector<StateEntry>>;

    std::string _stateFilePath;
    mutable std::mutex _mutex;

    Records readRecords() const;
    void writeRecords(const Records &records) const;
};

#endif
