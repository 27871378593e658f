#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>

/**
 * Byte-level progress hook: (bytes received so far, total bytes or 0 if unknown).
 * An empty function means no reporting.
 */
using ProgressCallback = std::function<void(std::uint64_t downloaded, std::uint64_t total)>;

struct HttpRequest
{
    std::string url;
    std::map<std::string, std::string> headers;
    int timeoutSeconds = 30;
};

struct HttpResponse
{
    long status = 0;
    std::vector<std::uint8_t> body;

    std::string text() const { return std::string(body.begin(), body.end()); }
};

/**
 * Anything that can perform a GET. HttpClient in production, a fake in tests.
 */
using HttpTransport = std::function<HttpResponse(const HttpRequest &, const ProgressCallback &)>;

/**
 * HTTP client for fetching packages into memory using libcurl.
 * Uses RAII to manage CURL handle lifecycle. One handle is reused for every
 * request so connections to the same host are kept alive.
 */
class HttpClient
{
public:
    HttpClient();
    ~HttpClient();

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    // Move operations (allow transferring ownership)
    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Perform a single GET and buffer the whole body.
     * HTTP status codes are returned, not thrown; callers decide what they mean.
     *
     * @param request URL, extra headers and total timeout
     * @param onProgress Optional progress hook
     * @return Status code and body bytes
     * @throws TransportError on transient curl failures (retry may help)
     * @throws ExtensionFetchError on permanent curl failures
     */
    HttpResponse get(const HttpRequest &request, const ProgressCallback &onProgress = {});

    /**
     * Adapter so the client can be handed to code expecting an HttpTransport.
     * The client must outlive the returned function.
     */
    HttpTransport transport();

    /**
     * Percent-encode a string for use inside a URL path segment.
     */
    static std::string escape(const std::string &value);

    /**
     * Get human-readable HTTP status text for a status code.
     *
     * @param code HTTP status code (e.g., 200, 404, 500)
     * @return Descriptive text for the status code
     */
    static std::string statusText(long code);

    /**
     * True when retrying a failed transfer with this code can't help
     * (bad URL, certificate rejected, redirect loop, ...).
     */
    static bool isPermanentError(CURLcode code);

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    /**
     * Error classification for retry logic.
     * Transient errors are temporary (network issues) and worth retrying.
     * Permanent errors are unrecoverable (invalid URL, bad certificate).
     */
    enum class ErrorType
    {
        Transient, // Temporary failure - retry might succeed
        Permanent, // Permanent failure - retrying won't help
        Unknown    // Uncertain - treat conservatively as transient
    };

    /**
     * Static callback for libcurl to append downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     *
     * @param userdata User-provided pointer (we pass std::vector<std::uint8_t>*)
     * @return Number of bytes consumed (size * nmemb on success)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static progress callback for libcurl. Forwards to the ProgressCallback
     * passed in clientp.
     *
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    /**
     * Classify a CURL error to determine if retry is appropriate.
     */
    static ErrorType classifyError(CURLcode code);

    // Size of each chunk libcurl hands to writeCallback
    static constexpr long CHUNK_SIZE = 8 * 1024;
    static constexpr long CONNECT_TIMEOUT_SECONDS = 30;
    static constexpr long MAX_REDIRECTS = 5;
};
