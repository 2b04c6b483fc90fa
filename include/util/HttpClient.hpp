#ifndef HTTPCLIENT_HPP
#define HTTPCLIENT_HPP

#include <string>
#include <functional>
#include <curl/curl.h>

#include "core/Segment.hpp"
#include "aux/CancellationToken.hpp"

struct HttpResult
{
    CURLcode errorCode{CURLE_OK};
    long httpStatus{0};

    bool ok() const { return errorCode == CURLE_OK; }
    std::string getErrorMessage() const;
};

struct ResourceInfo
{
    ByteOffset length{-1}; // -1 when the server sent no length
    bool acceptsRanges{false};
};

// Network collaborator used by the coordinator and its workers
class HttpClient
{
public:
    // Receives body bytes in order; returning false aborts the transfer
    using WriteCallback = std::function<bool(const char *data, size_t size)>;

    // Called with bytes delivered to the sink so far and the expected body size (0 if unknown);
    // returning false aborts the transfer
    using ProgressCallback = std::function<bool(ByteOffset bytesTransferred, ByteOffset totalExpected)>;

    virtual ~HttpClient() = default;

    virtual HttpResult probeLength(const std::string &url, ResourceInfo &info) = 0;

    // Fetches the inclusive byte range [start, end], following redirects
    virtual HttpResult fetchRange(const std::string &url,
                                  ByteOffset start,
                                  ByteOffset end,
                                  const WriteCallback &sink,
                                  const ProgressCallback &onProgress,
                                  const CancellationToken &cancel) = 0;
};

#endif
