#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <string>

#include <spdlog/spdlog.h>

#include "util/CurlHttpClient.hpp"

namespace
{
    struct FetchContext
    {
        CURL *handle{nullptr};
        ByteOffset start{0};
        const HttpClient::WriteCallback *sink{nullptr};
        const HttpClient::ProgressCallback *onProgress{nullptr};
        const CancellationToken *cancel{nullptr};
        ByteOffset delivered{0};
        ByteOffset expected{0};
        bool statusChecked{false};
        bool rangeIgnored{false};
    };

    // Passes incoming body bytes to the sink, rejecting full-body answers to a mid-file range
    size_t curlWriteCallback(void *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *context = static_cast<FetchContext *>(userdata);
        size_t totalBytes = size * nmemb;

        if (!context->statusChecked)
        {
            context->statusChecked = true;

            long status = 0;
            curl_easy_getinfo(context->handle, CURLINFO_RESPONSE_CODE, &status);
            if (status == 200 && context->start > 0)
            {
                context->rangeIgnored = true;
                return 0; // Aborts with CURLE_WRITE_ERROR
            }
        }

        if (!(*context->sink)(static_cast<const char *>(ptr), totalBytes))
        {
            return 0;
        }

        context->delivered += static_cast<ByteOffset>(totalBytes);
        return totalBytes;
    }

    // Called by libcurl about once a second even on an idle connection, which bounds how long
    // a cancellation can go unnoticed
    int curlProgressCallback(void *clientp,
                             curl_off_t dltotal,
                             curl_off_t /* dlnow */,
                             curl_off_t /* ultotal */,
                             curl_off_t /* ulnow */)
    {
        auto *context = static_cast<FetchContext *>(clientp);

        if (dltotal > 0)
        {
            context->expected = static_cast<ByteOffset>(dltotal);
        }

        if (!(*context->onProgress)(context->delivered, context->expected))
        {
            return 1;
        }

        return context->cancel->isCancelled() ? 1 : 0;
    }

    // Notes whether the server advertises byte-range support
    size_t headerCallback(char *buffer, size_t size, size_t nmemb, void *userData)
    {
        size_t length = size * nmemb;

        std::string header(buffer, length);
        std::transform(header.begin(), header.end(), header.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (header.rfind("accept-ranges:", 0) == 0 && header.find("bytes") != std::string::npos)
        {
            auto *info = static_cast<ResourceInfo *>(userData);
            info->acceptsRanges = true;
        }

        return length;
    }
}

std::string HttpResult::getErrorMessage() const
{
    std::string message = curl_easy_strerror(errorCode);
    if (httpStatus >= 400)
    {
        message += " (HTTP " + std::to_string(httpStatus) + ")";
    }
    return message;
}

CurlHttpClient::CurlHttpClient(long connectTimeoutSecs, long stallTimeoutSecs)
    : _connectTimeoutSecs(connectTimeoutSecs), _stallTimeoutSecs(stallTimeoutSecs)
{
}

void CurlHttpClient::configureCommon(CURL *curlHandle, const std::string &url) const
{
    curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L); // Follow redirects
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);       // Handles are used from worker threads
    curl_easy_setopt(curlHandle, CURLOPT_CONNECTTIMEOUT, _connectTimeoutSecs);

    // A connection delivering less than 1 byte/s for the stall timeout is treated as failed
    if (_stallTimeoutSecs > 0)
    {
        curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_TIME, _stallTimeoutSecs);
    }
}

// Discovers the resource size with a HEAD request
HttpResult CurlHttpClient::probeLength(const std::string &url, ResourceInfo &info)
{
    HttpResult result;

    CURL *curl = curl_easy_init();
    if (!curl)
    {
        result.errorCode = CURLE_FAILED_INIT;
        return result;
    }

    configureCommon(curl, url);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L); // HEAD request
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &info);

    result.errorCode = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpStatus);

    // Treat HTTP status codes 400 and above as errors
    if (result.ok() && result.httpStatus >= 400)
    {
        result.errorCode = CURLE_HTTP_RETURNED_ERROR;
    }

    if (result.ok())
    {
        curl_off_t length = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        info.length = static_cast<ByteOffset>(length);
    }

    curl_easy_cleanup(curl);

    spdlog::debug("Probed {}: status {}, length {}, ranges {}",
                  url, result.httpStatus, info.length, info.acceptsRanges ? "yes" : "no");
    return result;
}

HttpResult CurlHttpClient::fetchRange(const std::string &url,
                                      ByteOffset start,
                                      ByteOffset end,
                                      const WriteCallback &sink,
                                      const ProgressCallback &onProgress,
                                      const CancellationToken &cancel)
{
    HttpResult result;

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle)
    {
        result.errorCode = CURLE_FAILED_INIT;
        return result;
    }

    FetchContext context;
    context.handle = curlHandle;
    context.start = start;
    context.sink = &sink;
    context.onProgress = &onProgress;
    context.cancel = &cancel;

    std::string range = std::to_string(start) + "-" + std::to_string(end);

    configureCommon(curlHandle, url);
    curl_easy_setopt(curlHandle, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curlHandle, CURLOPT_NOPROGRESS, 0L); // Enable the transfer-info callback
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFOFUNCTION, curlProgressCallback);
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFODATA, &context);
    curl_easy_setopt(curlHandle, CURLOPT_FAILONERROR, 1L);

    result.errorCode = curl_easy_perform(curlHandle);
    curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &result.httpStatus);

    if (context.rangeIgnored)
    {
        spdlog::warn("Server ignored range {} of {}", range, url);
        result.errorCode = CURLE_RANGE_ERROR;
    }
    else if (result.ok())
    {
        // Final report so the caller sees every byte that reached the sink
        onProgress(context.delivered, context.expected);
    }

    curl_easy_cleanup(curlHandle);
    return result;
}
