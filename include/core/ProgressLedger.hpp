#ifndef PROGRESSLEDGER_HPP
#define PROGRESSLEDGER_HPP

#include <map>
#include <mutex>
#include <vector>
#include <functional>

#include "core/Segment.hpp"

struct LedgerSnapshot
{
    std::map<int, ByteOffset> positions; // Bytes transferred in the current attempt
    std::map<int, SegmentState> states;
};

// Shared record of per-segment progress for one download attempt.
// Every method may be called concurrently from any worker thread.
class ProgressLedger
{
public:
    using FlushCallback = std::function<void(const LedgerSnapshot &)>;

    // Starts a new attempt: every listed segment goes back to PENDING with 0 bytes.
    // onAllTerminal runs once, on the thread whose report settles the last outstanding segment.
    void reset(const std::vector<int> &segmentIds, FlushCallback onAllTerminal);

    void markInProgress(int segmentId);
    void reportProgress(int segmentId, ByteOffset bytesTransferred);

    // First terminal report per segment wins; returns false for repeats and unknown ids
    bool reportTerminal(int segmentId, SegmentState state);

    LedgerSnapshot snapshot() const;
    size_t getOutstanding() const;
    bool allComplete() const;
    ByteOffset getPosition(int segmentId) const;
    SegmentState getState(int segmentId) const;

private:
    mutable std::mutex _mutex;
    std::map<int, ByteOffset> _positions;
    std::map<int, SegmentState> _states;
    size_t _outstanding{0};
    FlushCallback _onAllTerminal;
};

#endif
