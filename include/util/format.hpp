#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <string>

std::string formatBytes(double bytes);

#endif
