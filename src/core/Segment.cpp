#include "core/Segment.hpp"

const char *segmentStateToString(SegmentState state)
{
    switch (state)
    {
    case SegmentState::PENDING:
        return "pending";
    case SegmentState::IN_PROGRESS:
        return "in-progress";
    case SegmentState::COMPLETE:
        return "complete";
    case SegmentState::INCOMPLETE:
        return "incomplete";
    }

    return "unknown";
}

bool segmentStateFromString(const std::string &text, SegmentState &state)
{
    if (text == "complete")
        state = SegmentState::COMPLETE;
    else if (text == "incomplete")
        state = SegmentState::INCOMPLETE;
    else if (text == "pending")
        state = SegmentState::PENDING;
    else if (text == "in-progress")
        state = SegmentState::IN_PROGRESS;
    else
        return false;

    return true;
}

bool isTerminalState(SegmentState state)
{
    return state == SegmentState::COMPLETE || state == SegmentState::INCOMPLETE;
}
