#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "retry.hpp"

/**
 * Client for the Chrome update service: resolves the browser version to
 * advertise and downloads CRX packages.
 */
class ChromeStoreClient
{
public:
    static constexpr const char *DEFAULT_CHROME_VERSION = "119.0.6045.0";
    static constexpr const char *VERSION_FEED_URL = "https://omahaproxy.appspot.com/all.json";
    static constexpr const char *USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/119.0.0.0 Safari/537.36";

    explicit ChromeStoreClient(HttpTransport transport,
                               RetryPolicy policy = RetryPolicy{},
                               Sleeper sleep = threadSleeper());

    /**
     * Pick the version string sent as prodversion.
     * An explicit version wins. Otherwise the public feed is queried and,
     * on any failure, DEFAULT_CHROME_VERSION is used with a warning.
     * Never throws for feed problems.
     */
    std::string resolveVersion(const std::optional<std::string> &requested);

    /**
     * Download the raw CRX for an extension.
     *
     * @throws NotFoundError on 404
     * @throws HttpStatusError on any other non-200 status
     * @throws RetryExhaustedError after 3 failed transport attempts
     */
    std::vector<std::uint8_t> downloadCrx(const std::string &extensionId,
                                          const std::string &chromeVersion,
                                          const ProgressCallback &onProgress = {});

    static std::string buildCrxUrl(const std::string &extensionId, const std::string &chromeVersion);

    /**
     * First win64/stable version in the feed, or nullopt if the document
     * doesn't have one (including unparsable input).
     */
    static std::optional<std::string> parseVersionFeed(const std::string &json);

private:
    HttpTransport transport_;
    RetryPolicy policy_;
    Sleeper sleep_;
};
