#ifndef HTTP_HPP
#define HTTP_HPP

#include <string>

namespace http
{
    // Derives the target file name from the final path component of the URL, ignoring any
    // query string or fragment. Returns an empty string if the URL has no usable component.
    std::string deriveFilenameFromUrl(const std::string &url);
}

#endif
