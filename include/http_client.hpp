#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <curl/curl.h>

/**
 * Result of a header-only (HEAD) probe against one mirror.
 */
struct HeadResponse
{
    bool connected = false;         // false if the request never got a response
    long statusCode = 0;            // Final HTTP status (after redirects)
    std::int64_t contentLength = -1; // -1 when the server sent no Content-Length
    std::string etag;               // Raw ETag header value, quotes included
    std::string error;              // Transport error text when !connected
};

/**
 * A ranged GET for the inclusive byte range [first, last].
 */
struct RangeRequest
{
    std::string url;
    std::int64_t first = 0;
    std::int64_t last = 0;

    // Accept a plain 200 (server ignored Range) only if the range is the whole file
    bool allowFullResponse = false;

    std::chrono::milliseconds timeout{30000};

    // Receives body bytes in arrival order. Return false to abort the transfer.
    std::function<bool(const char *data, size_t size)> onData;

    // Polled while the transfer runs; returning true aborts it.
    std::function<bool()> isCancelled;
};

enum class TransferStatus
{
    Completed,        // Body delivered until end-of-stream
    ConnectionFailed, // DNS, connect, timeout, reset...
    BadStatus,        // Server answered with an unacceptable status code
    Aborted           // onData or isCancelled stopped the transfer
};

struct RangeResponse
{
    TransferStatus status = TransferStatus::ConnectionFailed;
    long statusCode = 0;
    std::string error;
};

/**
 * The two HTTP operations the downloader needs.
 * Implementations must be callable from several threads at once.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HeadResponse head(const std::string &url, std::chrono::milliseconds timeout) = 0;

    virtual RangeResponse getRange(const RangeRequest &request) = 0;
};

/**
 * HttpTransport backed by libcurl.
 * Every request gets its own easy handle, so one instance can be shared
 * by all worker threads.
 */
class CurlTransport : public HttpTransport
{
public:
    CurlTransport();
    ~CurlTransport() override;

    // Delete copy operations (one transport is shared by reference)
    CurlTransport(const CurlTransport &) = delete;
    CurlTransport &operator=(const CurlTransport &) = delete;

    HeadResponse head(const std::string &url, std::chrono::milliseconds timeout) override;

    RangeResponse getRange(const RangeRequest &request) override;

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    /**
     * Create an easy handle with the options shared by HEAD and GET:
     * user-agent, TLS verification, redirects, timeouts, no signals.
     *
     * @throws std::runtime_error if libcurl cannot allocate a handle
     */
    CurlHandle makeHandle(const std::string &url, std::chrono::milliseconds timeout) const;

    /**
     * Static header callback: picks the ETag out of the response headers.
     * Resets on every status line so only the final response after
     * redirects counts.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static callback for libcurl to hand over body data.
     * Validates the status code on the first call, then forwards to
     * RangeRequest::onData. Returning anything but size * nmemb aborts.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static transfer-info callback; aborts the transfer once the
     * session has been cancelled.
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);
};

/**
 * Get human-readable HTTP status text for a status code.
 *
 * @param code HTTP status code (e.g., 200, 404, 500)
 * @return Descriptive text for the status code
 */
std::string httpStatusText(long code);

/**
 * Derive a local filename from the last path segment of a URL.
 * Query and fragment are ignored and the segment is percent-decoded.
 *
 * @return The filename, or "downloaded-file" if the URL has none
 */
std::string urlToFilename(const std::string &url);
