#include <string>

#include "util/http.hpp"

namespace http
{
    std::string deriveFilenameFromUrl(const std::string &url)
    {
        // Drop the query string and fragment
        std::string path = url.substr(0, url.find_first_of("?#"));

        // Skip past "scheme://host" so a bare host is never taken for a file name
        auto schemePos = path.find("://");
        size_t pathStart = schemePos == std::string::npos ? 0 : schemePos + 3;
        auto firstSlash = path.find('/', pathStart);
        if (schemePos != std::string::npos && firstSlash == std::string::npos)
        {
            return std::string();
        }

        auto pos = path.find_last_of('/');
        std::string fname = pos == std::string::npos ? path : path.substr(pos + 1);

        // Either no component or the URL ends with '/'
        if (fname.empty() || fname == "." || fname == "..")
        {
            return std::string();
        }

        return fname;
    }
}
