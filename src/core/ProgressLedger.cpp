#include <spdlog/spdlog.h>

#include "core/ProgressLedger.hpp"

void ProgressLedger::reset(const std::vector<int> &segmentIds, FlushCallback onAllTerminal)
{
    std::lock_guard<std::mutex> lock(_mutex);

    _positions.clear();
    _states.clear();
    for (int id : segmentIds)
    {
        _positions[id] = 0;
        _states[id] = SegmentState::PENDING;
    }

    _outstanding = _states.size();
    _onAllTerminal = std::move(onAllTerminal);
}

void ProgressLedger::markInProgress(int segmentId)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _states.find(segmentId);
    if (it != _states.end() && it->second == SegmentState::PENDING)
    {
        it->second = SegmentState::IN_PROGRESS;
    }
}

void ProgressLedger::reportProgress(int segmentId, ByteOffset bytesTransferred)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _positions.find(segmentId);
    if (it == _positions.end())
    {
        return;
    }

    it->second = bytesTransferred;
    if (_states[segmentId] == SegmentState::PENDING)
    {
        _states[segmentId] = SegmentState::IN_PROGRESS;
    }
}

bool ProgressLedger::reportTerminal(int segmentId, SegmentState state)
{
    if (!isTerminalState(state))
    {
        return false;
    }

    LedgerSnapshot finalSnapshot;
    FlushCallback flush;
    {
        std::lock_guard<std::mutex> lock(_mutex);

        auto it = _states.find(segmentId);
        if (it == _states.end())
        {
            spdlog::warn("Terminal report for unknown segment {}", segmentId);
            return false;
        }

        // Only the first terminal report counts towards the outstanding total
        if (isTerminalState(it->second))
        {
            return false;
        }

        it->second = state;
        --_outstanding;
        spdlog::debug("Segment {} is {} ({} outstanding)", segmentId, segmentStateToString(state), _outstanding);

        if (_outstanding == 0 && _onAllTerminal)
        {
            finalSnapshot.positions = _positions;
            finalSnapshot.states = _states;
            flush = std::move(_onAllTerminal);
            _onAllTerminal = nullptr;
        }
    }

    // Run the flush outside the lock so it may read the ledger
    if (flush)
    {
        flush(finalSnapshot);
    }

    return true;
}

LedgerSnapshot ProgressLedger::snapshot() const
{
    std::lock_guard<std::mutex> lock(_mutex);

    LedgerSnapshot result;
    result.positions = _positions;
    result.states = _states;
    return result;
}

size_t ProgressLedger::getOutstanding() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _outstanding;
}

bool ProgressLedger::allComplete() const
{
    std::lock_guard<std::mutex> lock(_mutex);

    for (const auto &entry : _states)
    {
        if (entry.second != SegmentState::COMPLETE)
            return false;
    }

    return true;
}

ByteOffset ProgressLedger::getPosition(int segmentId) const
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _positions.find(segmentId);
    return it == _positions.end() ? 0 : it->second;
}

SegmentState ProgressLedger::getState(int segmentId) const
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _states.find(segmentId);
    return it == _states.end() ? SegmentState::PENDING : it->second;
}
