#ifndef RANGEPLANNER_HPP
#define RANGEPLANNER_HPP

#include <vector>

#include "core/Segment.hpp"

class RangePlanner
{
public:
    // Throws DownloadError(INVALID_CONFIGURATION) for a non-positive segment count,
    // an unknown size, or more segments than bytes
    RangePlanner(ByteOffset totalSize, int segmentCount);

    std::vector<Segment> plan() const;

    ByteOffset getPartitionSize() const { return _partitionSize; }
    ByteOffset plannedStart(int segmentId) const;
    ByteOffset plannedEnd(int segmentId) const;

private:
    ByteOffset _totalSize;
    int _segmentCount;
    ByteOffset _partitionSize;
};

#endif
