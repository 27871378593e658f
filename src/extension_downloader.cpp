#include "extension_downloader.hpp"
#include "crx_file.hpp"

#include <utility>

#include <spdlog/spdlog.h>

ExtensionDownloader::ExtensionDownloader(ChromeStoreClient chrome, FirefoxAddonsClient firefox)
    : chrome_(std::move(chrome)), firefox_(std::move(firefox))
{
}

ExtensionDownloader::ExtensionDownloader(HttpTransport transport)
    : chrome_(transport), firefox_(transport)
{
}

std::vector<std::uint8_t> ExtensionDownloader::fetch(const DownloadRequest &request, const ProgressCallback &onProgress)
{
    if (request.platform == Platform::Chrome)
    {
        return fetchChrome(request, onProgress);
    }
    return fetchFirefox(request, onProgress);
}

std::vector<std::string> ExtensionDownloader::listVersions(const std::string &addonId)
{
    return firefox_.listVersions(addonId);
}

std::vector<std::uint8_t> ExtensionDownloader::fetchChrome(const DownloadRequest &request,
                                                           const ProgressCallback &onProgress)
{
    std::string chromeVersion;
    if (request.version)
    {
        chromeVersion = *request.version;
    }
    else
    {
        if (!latestChromeVersion_)
        {
            latestChromeVersion_ = chrome_.resolveVersion(std::nullopt);
        }
        chromeVersion = *latestChromeVersion_;
    }

    spdlog::info("Downloading CRX3 for {} (version {}) …", request.id, chromeVersion);
    std::vector<std::uint8_t> crx = chrome_.downloadCrx(request.id, chromeVersion, onProgress);

    std::vector<std::uint8_t> archive = CrxFile::extractArchive(crx);
    spdlog::debug("CRX format version {}, {} header bytes stripped",
                  CrxFile::formatVersion(crx), crx.size() - archive.size());
    return archive;
}

std::vector<std::uint8_t> ExtensionDownloader::fetchFirefox(const DownloadRequest &request,
                                                            const ProgressCallback &onProgress)
{
    spdlog::info("Fetching Firefox addon info for {} ({}) …", request.id,
                 request.version ? "version " + *request.version : std::string("latest"));
    std::string url = firefox_.resolveDownloadUrl(request.id, request.version);

    spdlog::info("Downloading XPI …");
    return firefox_.downloadXpi(url, onProgress);
}
