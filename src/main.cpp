#include <map>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <spdlog/spdlog.h>
#include "batch_runner.hpp"
#include "checksum.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "extension_downloader.hpp"
#include "extension_id.hpp"
#include "http_client.hpp"
#include "progress_bar.hpp"

namespace
{
// Prints the versions AMO lists for a single addon (--list-versions)
int listVersions(const FetchConfig &config, const std::string &id)
{
    if (config.platform == Platform::Chrome)
    {
        fmt::print("Listing versions is not supported for Chrome; specify version manually.\n");
        return 0;
    }

    try
    {
        ExtensionIdValidator::require(id, config.platform);

        HttpClient client;
        ExtensionDownloader downloader(client.transport());
        std::vector<std::string> versions = downloader.listVersions(id);
        fmt::print("Available versions for {}: {}\n", id, fmt::join(versions, ", "));
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Error listing versions: {}\n", e.what());
        return 1;
    }
}
} // namespace

int main(int argc, char *argv[])
{
    // Create CLI11 app
    CLI::App app{"extfetch - Download Chrome or Firefox extensions by ID and save them as plain ZIP"};

    // Configuration struct to be populated
    FetchConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("extension_id", config.extensionId,
                   "Extension ID (Chrome: 32 chars a-z0-9; Firefox: GUID or slug); optional with --batch");

    app.add_option("-o,--output", config.output,
                   "Output ZIP file path (default: {extension_id}.zip)");

    app.add_option("-v,--version", config.version,
                   "Version to fetch (default: latest)");

    std::map<std::string, Platform> platforms{{"chrome", Platform::Chrome}, {"firefox", Platform::Firefox}};
    app.add_option("--platform", config.platform, "Platform to download from (default: chrome)")
        ->transform(CLI::CheckedTransformer(platforms, CLI::ignore_case));

    app.add_option("--batch", config.batch,
                   "Batch download: file path (one ID per line) or comma-separated IDs");

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected archive checksum 'sha256:hexhash' (single ID only)")
        ->check([](const std::string &cs) -> std::string {
            try {
                ChecksumVerifier::parseChecksum(cs);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            }
        });

    app.add_flag("--verbose", config.verbose, "Enable verbose logging");
    app.add_flag("-f,--force", config.force, "Overwrite output file if it exists");
    app.add_flag("--continue-on-error", config.continueOnError, "Continue batch download on individual errors");
    app.add_flag("--list-versions", config.listVersions, "List available versions for the addon (Firefox)");
    app.add_flag("--no-progress", config.noProgress, "Don't show download progress");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    spdlog::set_pattern("%l: %v");
    spdlog::set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);

    // ====================================================================
    // COLLECT IDENTIFIERS
    // ====================================================================

    if (!config.batch && !config.extensionId)
    {
        fmt::print(stderr, "✗ Error: Must provide extension_id, --batch, or --list-versions.\n");
        return 1;
    }

    std::vector<std::string> ids;
    try
    {
        ids = collectIdentifiers(config.extensionId, config.batch);
    }
    catch (const BatchSourceError &e)
    {
        fmt::print(stderr, "✗ Error: {}\n", e.what());
        return 1;
    }

    if (config.listVersions)
    {
        if (ids.size() != 1)
        {
            fmt::print(stderr, "✗ Error: --list-versions requires exactly one ID.\n");
            return 1;
        }
        return listVersions(config, ids.front());
    }

    if (ids.size() > 1 && (config.output || config.expectedChecksum))
    {
        fmt::print(stderr, "✗ Error: --output and --checksum can only be used with a single ID.\n");
        return 1;
    }

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    try
    {
        // Create HTTP client (RAII ensures cleanup); shared by every request in the run
        HttpClient client;
        ExtensionDownloader downloader(client.transport());
        ProgressBar progress;

        BatchOptions options;
        options.platform = config.platform;
        options.version = config.version;
        if (config.output)
        {
            options.output = std::filesystem::path(*config.output);
        }
        options.expectedChecksum = config.expectedChecksum;
        options.force = config.force;
        options.continueOnError = config.continueOnError;

        BatchRunner runner(options, [&](const DownloadRequest &request) {
            ProgressCallback onProgress = config.noProgress ? ProgressCallback{} : progress.callback();
            progress.start();
            try
            {
                auto archive = downloader.fetch(request, onProgress);
                progress.finish();
                return archive;
            }
            catch (...)
            {
                progress.finish();
                throw;
            }
        });

        BatchResult result = runner.run(ids);

        if (result.aborted())
        {
            fmt::print(stderr, "✗ Error: {}\n", result.fatal->reason);
            return result.exitCode();
        }

        for (const auto &path : result.written)
        {
            fmt::print("✓ Saved {}\n", path.string());
        }
        if (ids.size() > 1)
        {
            fmt::print("Downloaded {} of {} extensions", result.succeeded, ids.size());
            if (!result.skipped.empty())
            {
                fmt::print(" ({} skipped)", result.skipped.size());
            }
            fmt::print("\n");
        }
        for (const auto &skip : result.skipped)
        {
            fmt::print(stderr, "✗ {}: {}\n", skip.id, skip.reason);
        }
        return result.exitCode();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
