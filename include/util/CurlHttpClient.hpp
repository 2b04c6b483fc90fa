#ifndef CURLHTTPCLIENT_HPP
#define CURLHTTPCLIENT_HPP

#include "util/HttpClient.hpp"

static constexpr long SEGDL_DEFAULT_CONNECT_TIMEOUT_SECS = 30;
static constexpr long SEGDL_DEFAULT_STALL_TIMEOUT_SECS = 60;

// libcurl implementation; one easy handle per call so workers never share a handle
class CurlHttpClient : public HttpClient
{
public:
    CurlHttpClient(long connectTimeoutSecs = SEGDL_DEFAULT_CONNECT_TIMEOUT_SECS,
                   long stallTimeoutSecs = SEGDL_DEFAULT_STALL_TIMEOUT_SECS);

    HttpResult probeLength(const std::string &url, ResourceInfo &info) override;

    HttpResult fetchRange(const std::string &url,
                          ByteOffset start,
                          ByteOffset end,
                          const WriteCallback &sink,
                          const ProgressCallback &onProgress,
                          const CancellationToken &cancel) override;

private:
    long _connectTimeoutSecs;
    long _stallTimeoutSecs;

    void configureCommon(CURL *curlHandle, const std::string &url) const;
};

#endif
