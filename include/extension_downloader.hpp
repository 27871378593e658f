#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chrome_store.hpp"
#include "config.hpp"
#include "firefox_addons.hpp"

struct DownloadRequest
{
    std::string id;
    Platform platform = Platform::Chrome;
    std::optional<std::string> version;
};

/**
 * Resolve, fetch and normalize one extension into plain archive bytes.
 *
 * Chrome: resolve prodversion, download the CRX, strip its header.
 * Firefox: resolve the XPI URL through AMO, download it verbatim.
 */
class ExtensionDownloader
{
public:
    ExtensionDownloader(ChromeStoreClient chrome, FirefoxAddonsClient firefox);

    /**
     * Build both clients on the same transport with default retry policies.
     */
    explicit ExtensionDownloader(HttpTransport transport);

    /**
     * @return Archive bytes ready to be written as .zip
     * @throws ExtensionFetchError (or a subclass) on any failure
     */
    std::vector<std::uint8_t> fetch(const DownloadRequest &request, const ProgressCallback &onProgress = {});

    /**
     * Firefox versions for an addon. Chrome has no listing endpoint.
     */
    std::vector<std::string> listVersions(const std::string &addonId);

private:
    std::vector<std::uint8_t> fetchChrome(const DownloadRequest &request, const ProgressCallback &onProgress);
    std::vector<std::uint8_t> fetchFirefox(const DownloadRequest &request, const ProgressCallback &onProgress);

    ChromeStoreClient chrome_;
    FirefoxAddonsClient firefox_;

    // Feed result reused for every Chrome id in a run
    std::optional<std::string> latestChromeVersion_;
};
