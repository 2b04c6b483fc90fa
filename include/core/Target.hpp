#ifndef TARGET_HPP
#define TARGET_HPP

#include <string>

#include "core/Segment.hpp"

// The remote resource being downloaded; fixed once the size probe has answered
struct Target
{
    std::string url;
    std::string fileName;
    ByteOffset totalSize{0};
    int segmentCount{0};
};

#endif
