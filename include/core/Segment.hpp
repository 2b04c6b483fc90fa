#ifndef SEGMENT_HPP
#define SEGMENT_HPP

#include <cstdint>
#include <string>

using ByteOffset = std::int64_t;

enum class SegmentState
{
    PENDING,
    IN_PROGRESS,
    COMPLETE,
    INCOMPLETE
};

struct Segment
{
    int id{0};
    ByteOffset start{0};      // First byte of the range (inclusive)
    ByteOffset end{0};        // Last byte of the range (inclusive)
    ByteOffset lastOffset{0}; // Confirmed offset at resume time, 0 for fresh segments
    SegmentState state{SegmentState::PENDING};
};

// Outcome of one transfer attempt for a single segment
struct SegmentResult
{
    SegmentState state{SegmentState::INCOMPLETE};
    std::string reason;

    bool isComplete() const { return state == SegmentState::COMPLETE; }
};

const char *segmentStateToString(SegmentState state);
bool segmentStateFromString(const std::string &text, SegmentState &state);
bool isTerminalState(SegmentState state);

#endif
