#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "http_client.hpp"
#include "retry.hpp"

/**
 * One entry of the addons.mozilla.org versions listing.
 */
struct AddonVersion
{
    std::string version;
    std::optional<std::string> fileUrl;
};

/**
 * One page of /addon/{id}/versions/. next is the absolute URL of the
 * following page when there is one.
 */
struct AddonVersionsPage
{
    std::vector<AddonVersion> versions;
    std::optional<std::string> next;
};

/**
 * Client for the addons.mozilla.org (AMO) v5 API and XPI file downloads.
 *
 * API calls retry on transport errors and unparsable bodies with 2s/4s
 * backoff, and on HTTP 429 after a fixed 5s pause.
 */
class FirefoxAddonsClient
{
public:
    static constexpr const char *API_BASE = "https://addons.mozilla.org/api/v5/addons/addon/";
    static constexpr const char *USER_AGENT =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:109.0) Gecko/20100101 Firefox/115.0";

    // Hard stop when following "next" links
    static constexpr int MAX_VERSION_PAGES = 50;

    /**
     * Policy used when none is given: 3 attempts, 2s base delay.
     */
    static RetryPolicy defaultPolicy();

    explicit FirefoxAddonsClient(HttpTransport transport,
                                 RetryPolicy policy = defaultPolicy(),
                                 Sleeper sleep = threadSleeper());

    /**
     * Resolve the direct XPI URL for an addon.
     *
     * @param addonId GUID or slug
     * @param version Exact version string, or nullopt for the current one
     * @throws NotFoundError if the addon doesn't exist
     * @throws ApiResponseError if the current version has no file URL
     * @throws VersionNotFoundError if no listed version matches
     */
    std::string resolveDownloadUrl(const std::string &addonId, const std::optional<std::string> &version);

    /**
     * Every version string AMO lists for the addon, newest first.
     */
    std::vector<std::string> listVersions(const std::string &addonId);

    /**
     * Download the XPI at a URL returned by resolveDownloadUrl().
     *
     * @throws HttpStatusError on a non-200 status
     * @throws RetryExhaustedError after 3 failed transport attempts
     */
    std::vector<std::uint8_t> downloadXpi(const std::string &url, const ProgressCallback &onProgress = {});

    static std::string addonUrl(const std::string &addonId);
    static std::string versionsUrl(const std::string &addonId);

    /**
     * Extract current_version.file.url from an /addon/{id}/ document.
     *
     * @throws ApiResponseError naming the first missing field
     */
    static std::string parseCurrentFileUrl(const nlohmann::json &addon);

    static AddonVersionsPage parseVersionsPage(const nlohmann::json &page);

private:
    /**
     * GET an API URL and parse the body, with retries.
     * 404, 429 and other non-200 statuses are mapped to exceptions here.
     */
    nlohmann::json fetchJson(const std::string &url, const std::string &what);

    HttpTransport transport_;
    RetryPolicy policy_;
    Sleeper sleep_;
};
