#include "chrome_store.hpp"
#include "errors.hpp"

#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace
{
// Empty when the key is absent or not a string
std::string stringField(const nlohmann::json &object, const char *key)
{
    auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
}
} // namespace

ChromeStoreClient::ChromeStoreClient(HttpTransport transport, RetryPolicy policy, Sleeper sleep)
    : transport_(std::move(transport)), policy_(policy), sleep_(std::move(sleep))
{
}

std::string ChromeStoreClient::resolveVersion(const std::optional<std::string> &requested)
{
    if (requested && !requested->empty())
    {
        return *requested;
    }

    // Best effort: the update service treats prodversion as advisory
    try
    {
        HttpRequest request{VERSION_FEED_URL, {{"User-Agent", USER_AGENT}}, kVersionFeedTimeoutSeconds};
        spdlog::debug("GET {}", request.url);
        HttpResponse response = transport_(request, {});
        if (response.status != 200)
        {
            spdlog::warn("Chrome version feed returned HTTP {}; using default version {}",
                         response.status, DEFAULT_CHROME_VERSION);
            return DEFAULT_CHROME_VERSION;
        }

        if (auto version = parseVersionFeed(response.text()))
        {
            return *version;
        }
        spdlog::warn("Chrome version feed has no win64 stable entry; using default version {}",
                     DEFAULT_CHROME_VERSION);
    }
    catch (const std::exception &e)
    {
        spdlog::warn("Chrome version lookup failed ({}); using default version {}",
                     e.what(), DEFAULT_CHROME_VERSION);
    }
    return DEFAULT_CHROME_VERSION;
}

std::vector<std::uint8_t> ChromeStoreClient::downloadCrx(const std::string &extensionId,
                                                         const std::string &chromeVersion,
                                                         const ProgressCallback &onProgress)
{
    HttpRequest request{buildCrxUrl(extensionId, chromeVersion),
                        {{"User-Agent", USER_AGENT}},
                        kCrxTimeoutSeconds};
    spdlog::debug("GET {}", request.url);

    return retryWithBackoff(policy_, "Download", [&]() {
        HttpResponse response = transport_(request, onProgress);
        if (response.status == 404)
        {
            throw NotFoundError("Extension not found or invalid ID.");
        }
        if (response.status != 200)
        {
            throw HttpStatusError(response.status, fmt::format("HTTP {}: {}", response.status,
                                                               HttpClient::statusText(response.status)));
        }
        return std::move(response.body);
    }, sleep_);
}

std::string ChromeStoreClient::buildCrxUrl(const std::string &extensionId, const std::string &chromeVersion)
{
    return fmt::format("https://clients2.google.com/service/update2/crx?"
                       "response=redirect&prodversion={}&acceptformat=crx2,crx3&"
                       "x=id%3D{}%26installsource%3Dondemand%26uc",
                       HttpClient::escape(chromeVersion), extensionId);
}

std::optional<std::string> ChromeStoreClient::parseVersionFeed(const std::string &json)
{
    nlohmann::json feed = nlohmann::json::parse(json, nullptr, false);
    if (feed.is_discarded() || !feed.is_array())
    {
        return std::nullopt;
    }

    for (const auto &entry : feed)
    {
        if (!entry.is_object() || stringField(entry, "os") != "win64" || stringField(entry, "channel") != "stable")
        {
            continue;
        }
        auto versions = entry.find("versions");
        if (versions == entry.end() || !versions->is_array() || versions->empty())
        {
            continue;
        }
        const auto &first = versions->front();
        if (first.is_object() && first.contains("version") && first["version"].is_string())
        {
            return first["version"].get<std::string>();
        }
    }
    return std::nullopt;
}
