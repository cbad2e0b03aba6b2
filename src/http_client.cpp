#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

namespace
{
    std::once_flag curlInitFlag;

    constexpr long CONNECT_TIMEOUT_MS = 30000;
    constexpr long MAX_REDIRECTS = 5;

    struct HeadContext
    {
        std::string etag;
    };

    struct RangeContext
    {
        const RangeRequest *request = nullptr;
        CURL *handle = nullptr;
        bool statusChecked = false;
        bool badStatus = false;
        bool aborted = false;
        long statusCode = 0;
    };

    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(),
                                    [](unsigned char c) { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    bool isAcceptedRangeStatus(long code, bool allowFullResponse)
    {
        return code == 206 || (code == 200 && allowFullResponse);
    }
}

CurlTransport::CurlTransport()
{
    // curl_global_init is not thread-safe; do it once before any worker starts
    std::call_once(curlInitFlag, []()
                   {
                       if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
                       {
                           throw std::runtime_error("Failed to initialize libcurl");
                       }
                   });
}

// Global state is kept for the process lifetime
CurlTransport::~CurlTransport() = default;

CurlTransport::CurlHandle CurlTransport::makeHandle(const std::string &url,
                                                   std::chrono::milliseconds timeout) const
{
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        throw std::runtime_error("Failed to initialized CURL (out of memory or library error)");
    }

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "mirrorfetch/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);

    // Worker threads must not receive SIGALRM from the resolver timeout
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const long timeoutMs = static_cast<long>(timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(timeoutMs, CONNECT_TIMEOUT_MS));

    // 4xx/5xx end the request instead of delivering an error page as body
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);

    return curl;
}

size_t CurlTransport::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<HeadContext *>(userdata);

    std::string line(buffer, totalSize);

    // A new status line starts the headers of the next response in a redirect chain
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->etag.clear();
        return totalSize;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos)
    {
        return totalSize;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "etag")
    {
        context->etag = trim(line.substr(colon + 1));
    }

    return totalSize;
}

HeadResponse CurlTransport::head(const std::string &url, std::chrono::milliseconds timeout)
{
    HeadResponse response;
    HeadContext context;

    CurlHandle curl = makeHandle(url, timeout);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &context);

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.statusCode);

    if (res != CURLE_OK && response.statusCode == 0)
    {
        response.error = curl_easy_strerror(res);
        return response;
    }

    // Either a clean response or CURLOPT_FAILONERROR tripped on a 4xx/5xx
    response.connected = true;
    if (res == CURLE_HTTP_RETURNED_ERROR)
    {
        response.error = fmt::format("HTTP error {}: {}", response.statusCode, httpStatusText(response.statusCode));
        return response;
    }
    if (res != CURLE_OK)
    {
        // Headers arrived but the transfer still failed (e.g. timed out)
        response.error = curl_easy_strerror(res);
        return response;
    }

    curl_off_t contentLength = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) == CURLE_OK)
    {
        response.contentLength = static_cast<std::int64_t>(contentLength);
    }
    response.etag = context.etag;

    return response;
}

size_t CurlTransport::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *context = static_cast<RangeContext *>(userdata);

    // The status is known once the first body byte arrives
    if (!context->statusChecked)
    {
        context->statusChecked = true;
        curl_easy_getinfo(context->handle, CURLINFO_RESPONSE_CODE, &context->statusCode);
        if (!isAcceptedRangeStatus(context->statusCode, context->request->allowFullResponse))
        {
            context->badStatus = true;
            return 0;
        }
    }

    if (!context->request->onData(ptr, totalSize))
    {
        context->aborted = true;
        return 0;
    }

    return totalSize;
}

int CurlTransport::progressCallback(void *clientp,
                                    curl_off_t dltotal,
                                    curl_off_t dlnow,
                                    curl_off_t ultotal,
                                    curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<RangeContext *>(clientp);
    if (context->request->isCancelled && context->request->isCancelled())
    {
        context->aborted = true;
        return 1;
    }
    return 0;
}

RangeResponse CurlTransport::getRange(const RangeRequest &request)
{
    RangeResponse response;

    CurlHandle curl = makeHandle(request.url, request.timeout);

    RangeContext context;
    context.request = &request;
    context.handle = curl.get();

    std::string range = fmt::format("{}-{}", request.first, request.last);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);

    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);

    CURLcode res = curl_easy_perform(curl.get());
    if (context.statusCode == 0)
    {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &context.statusCode);
    }
    response.statusCode = context.statusCode;

    if (context.badStatus || res == CURLE_HTTP_RETURNED_ERROR)
    {
        response.status = TransferStatus::BadStatus;
        response.error = fmt::format("HTTP error {}: {}", response.statusCode, httpStatusText(response.statusCode));
        return response;
    }

    if (context.aborted)
    {
        response.status = TransferStatus::Aborted;
        response.error = "Transfer aborted";
        return response;
    }

    if (res != CURLE_OK)
    {
        response.status = TransferStatus::ConnectionFailed;
        response.error = curl_easy_strerror(res);
        return response;
    }

    // An empty body never reaches writeCallback, so check the status here too
    if (!isAcceptedRangeStatus(response.statusCode, request.allowFullResponse))
    {
        response.status = TransferStatus::BadStatus;
        response.error = fmt::format("Unexpected HTTP status {}: {}", response.statusCode, httpStatusText(response.statusCode));
        return response;
    }

    response.status = TransferStatus::Completed;
    return response;
}

std::string httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}

std::string urlToFilename(const std::string &url)
{
    static const std::string fallback = "downloaded-file";

    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), curl_url_cleanup);
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
    {
        return fallback;
    }

    char *rawPath = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &rawPath, CURLU_URLDECODE) != CURLUE_OK || !rawPath)
    {
        return fallback;
    }
    std::string path(rawPath);
    curl_free(rawPath);

    std::string name = std::filesystem::path(path).filename().string();
    if (name.empty() || name == "." || name == "..")
    {
        return fallback;
    }
    return name;
}
