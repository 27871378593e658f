#include "firefox_addons.hpp"
#include "errors.hpp"

#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{
// Non-empty string member, or nullopt
std::optional<std::string> stringMember(const nlohmann::json &object, const char *key)
{
    if (!object.is_object())
    {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get_ref<const std::string &>().empty())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Object member that is present and non-empty
const nlohmann::json *objectMember(const nlohmann::json &object, const char *key)
{
    if (!object.is_object())
    {
        return nullptr;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_object() || it->empty())
    {
        return nullptr;
    }
    return &*it;
}
} // namespace

RetryPolicy FirefoxAddonsClient::defaultPolicy()
{
    RetryPolicy policy;
    policy.baseDelay = std::chrono::seconds(2);
    return policy;
}

FirefoxAddonsClient::FirefoxAddonsClient(HttpTransport transport, RetryPolicy policy, Sleeper sleep)
    : transport_(std::move(transport)), policy_(policy), sleep_(std::move(sleep))
{
}

std::string FirefoxAddonsClient::resolveDownloadUrl(const std::string &addonId,
                                                    const std::optional<std::string> &version)
{
    if (!version)
    {
        return parseCurrentFileUrl(fetchJson(addonUrl(addonId), "API fetch"));
    }

    std::string url = versionsUrl(addonId);
    for (int page = 0; page < MAX_VERSION_PAGES; ++page)
    {
        AddonVersionsPage listing = parseVersionsPage(fetchJson(url, "Versions fetch"));
        for (const auto &entry : listing.versions)
        {
            if (entry.version == *version && entry.fileUrl)
            {
                return *entry.fileUrl;
            }
        }
        if (!listing.next)
        {
            break;
        }
        url = *listing.next;
    }
    throw VersionNotFoundError(fmt::format("Version {} not found for addon.", *version));
}

std::vector<std::string> FirefoxAddonsClient::listVersions(const std::string &addonId)
{
    std::vector<std::string> versions;
    std::string url = versionsUrl(addonId);
    for (int page = 0; page < MAX_VERSION_PAGES; ++page)
    {
        AddonVersionsPage listing = parseVersionsPage(fetchJson(url, "Versions fetch"));
        for (auto &entry : listing.versions)
        {
            versions.push_back(std::move(entry.version));
        }
        if (!listing.next)
        {
            break;
        }
        url = *listing.next;
    }
    return versions;
}

std::vector<std::uint8_t> FirefoxAddonsClient::downloadXpi(const std::string &url, const ProgressCallback &onProgress)
{
    HttpRequest request{url, {{"User-Agent", USER_AGENT}}, kXpiTimeoutSeconds};
    spdlog::debug("GET {}", url);

    return retryWithBackoff(policy_, "Download", [&]() {
        HttpResponse response = transport_(request, onProgress);
        if (response.status != 200)
        {
            throw HttpStatusError(response.status, fmt::format("Download failed: HTTP {}", response.status));
        }
        return std::move(response.body);
    }, sleep_);
}

std::string FirefoxAddonsClient::addonUrl(const std::string &addonId)
{
    return fmt::format("{}{}/", API_BASE, HttpClient::escape(addonId));
}

std::string FirefoxAddonsClient::versionsUrl(const std::string &addonId)
{
    return fmt::format("{}{}/versions/", API_BASE, HttpClient::escape(addonId));
}

std::string FirefoxAddonsClient::parseCurrentFileUrl(const nlohmann::json &addon)
{
    const nlohmann::json *currentVersion = objectMember(addon, "current_version");
    if (!currentVersion)
    {
        throw ApiResponseError("No current version found for addon.");
    }
    const nlohmann::json *file = objectMember(*currentVersion, "file");
    if (!file)
    {
        throw ApiResponseError("No file found for addon.");
    }
    auto url = stringMember(*file, "url");
    if (!url)
    {
        throw ApiResponseError("No download URL found.");
    }
    return *url;
}

AddonVersionsPage FirefoxAddonsClient::parseVersionsPage(const nlohmann::json &page)
{
    AddonVersionsPage result;
    if (!page.is_object())
    {
        return result;
    }

    auto results = page.find("results");
    if (results != page.end() && results->is_array())
    {
        for (const auto &entry : *results)
        {
            auto version = stringMember(entry, "version");
            if (!version)
            {
                continue;
            }
            AddonVersion item{*version, std::nullopt};
            if (const nlohmann::json *file = objectMember(entry, "file"))
            {
                item.fileUrl = stringMember(*file, "url");
            }
            result.versions.push_back(std::move(item));
        }
    }
    result.next = stringMember(page, "next");
    return result;
}

nlohmann::json FirefoxAddonsClient::fetchJson(const std::string &url, const std::string &what)
{
    HttpRequest request{url,
                        {{"User-Agent", USER_AGENT}, {"Accept", "application/json"}},
                        kApiTimeoutSeconds};
    spdlog::debug("GET {}", url);

    return retryWithBackoff(policy_, what, [&]() {
        HttpResponse response = transport_(request, {});
        switch (response.status)
        {
        case 200:
            break;
        case 404:
            throw NotFoundError("Firefox addon not found or invalid ID.");
        case 429:
            throw RateLimitedError("HTTP 429: rate limited by addons.mozilla.org");
        default:
            throw HttpStatusError(response.status, fmt::format("API error: HTTP {}", response.status));
        }

        nlohmann::json body = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
        if (body.is_discarded())
        {
            throw MalformedResponseError(fmt::format("Malformed JSON from {}", url));
        }
        return body;
    }, sleep_);
}
