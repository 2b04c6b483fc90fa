#include <string>

#include "core/RangePlanner.hpp"
#include "core/DownloadError.hpp"

RangePlanner::RangePlanner(ByteOffset totalSize, int segmentCount)
    : _totalSize(totalSize), _segmentCount(segmentCount), _partitionSize(0)
{
    if (segmentCount <= 0)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION,
                            "segment count must be positive, got " + std::to_string(segmentCount));
    }

    if (totalSize <= 0)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION, "size of the remote resource is unknown");
    }

    _partitionSize = totalSize / segmentCount;
    if (_partitionSize == 0)
    {
        throw DownloadError(ErrorKind::INVALID_CONFIGURATION,
                            std::to_string(segmentCount) + " segments requested for a " +
                                std::to_string(totalSize) + " byte resource");
    }
}

// Segment 1 starts at 0, segment k > 1 starts one byte after segment k - 1 ends.
// Every segment ends at k * partitionSize; bytes past N * partitionSize are left unplanned.
std::vector<Segment> RangePlanner::plan() const
{
    std::vector<Segment> segments;
    segments.reserve(static_cast<size_t>(_segmentCount));

    for (int id = 1; id <= _segmentCount; ++id)
    {
        Segment segment;
        segment.id = id;
        segment.start = plannedStart(id);
        segment.end = plannedEnd(id);
        segments.push_back(segment);
    }

    return segments;
}

ByteOffset RangePlanner::plannedStart(int segmentId) const
{
    if (segmentId <= 1)
        return 0;

    return static_cast<ByteOffset>(segmentId - 1) * _partitionSize + 1;
}

ByteOffset RangePlanner::plannedEnd(int segmentId) const
{
    return static_cast<ByteOffset>(segmentId) * _partitionSize;
}
