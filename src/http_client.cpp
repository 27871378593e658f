#include "http_client.hpp"
#include "errors.hpp"

#include <stdexcept>

#include <fmt/core.h>

HttpClient::HttpClient() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }

    // Fallback user-agent; callers normally send a browser one in the headers
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, "extfetch/1.0");
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;

    // userdata is the response body buffer (we pass it in get)
    auto *body = static_cast<std::vector<std::uint8_t> *>(userdata);
    body->insert(body->end(),
                 reinterpret_cast<const std::uint8_t *>(ptr),
                 reinterpret_cast<const std::uint8_t *>(ptr) + totalSize);

    // If we return a different value, libcurl aborts the transfer
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)ultotal;
    (void)ulnow;

    const auto *onProgress = static_cast<const ProgressCallback *>(clientp);
    if (*onProgress && dlnow > 0)
    {
        (*onProgress)(static_cast<std::uint64_t>(dlnow),
                      dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0);
    }
    return 0;
}

HttpResponse HttpClient::get(const HttpRequest &request, const ProgressCallback &onProgress)
{
    HttpResponse response;

    // Header list must stay alive until curl_easy_perform returns
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(nullptr, curl_slist_free_all);
    for (const auto &[name, value] : request.headers)
    {
        std::string line = fmt::format("{}: {}", name, value);
        curl_slist *appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended)
        {
            throw ExtensionFetchError("Failed to build request headers (out of memory)");
        }
        headerList.release();
        headerList.reset(appended);
    }

    CURL *curl = curl_.get();

    // 1. Target and headers
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    // 2. Accumulate body in memory, 8 KiB at a time
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, CHUNK_SIZE);

    // 3. HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // 4. The CRX endpoint answers with a redirect to the package host
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);

    // 5. Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);

    // 6. Progress tracking
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<ProgressCallback *>(&onProgress));

    CURLcode res = curl_easy_perform(curl);

    // Don't leave dangling pointers in the reused handle
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, nullptr);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, nullptr);

    if (res != CURLE_OK)
    {
        if (isPermanentError(res))
        {
            throw ExtensionFetchError(fmt::format("Request to {} failed: {}", request.url, curl_easy_strerror(res)));
        }
        throw TransportError(fmt::format("Request to {} failed: {}", request.url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

HttpTransport HttpClient::transport()
{
    return [this](const HttpRequest &request, const ProgressCallback &onProgress) {
        return get(request, onProgress);
    };
}

std::string HttpClient::escape(const std::string &value)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), curl_easy_cleanup);
    if (!handle)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }

    char *escaped = curl_easy_escape(handle.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped)
    {
        throw ExtensionFetchError(fmt::format("Cannot URL-encode '{}'", value));
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::statusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 204:
        return "No Content";
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

bool HttpClient::isPermanentError(CURLcode code)
{
    return classifyError(code) == ErrorType::Permanent;
}

// Classify error for retry logic
HttpClient::ErrorType HttpClient::classifyError(CURLcode code)
{
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:           // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:        // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL: // Protocol not supported
    case CURLE_OUT_OF_MEMORY:        // System resource exhaustion
    case CURLE_SSL_CERTPROBLEM:      // SSL certificate invalid
    case CURLE_PEER_FAILED_VERIFICATION: // Server certificate failed verification
    case CURLE_SSL_CIPHER:           // SSL cipher negotiation failed
    case CURLE_TOO_MANY_REDIRECTS:   // Redirect loop
        return ErrorType::Permanent;

    // Unknown CURL error - be conservative and retry
    default:
        return ErrorType::Unknown;
    }
}
