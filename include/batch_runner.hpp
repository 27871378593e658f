#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "extension_downloader.hpp"

/**
 * Per-run policy shared by every identifier in a batch.
 */
struct BatchOptions
{
    Platform platform = Platform::Chrome;
    std::optional<std::string> version;
    std::optional<std::filesystem::path> output; // single-identifier runs only
    std::optional<std::string> expectedChecksum; // single-identifier runs only
    bool force = false;
    bool continueOnError = false;
};

struct BatchFailure
{
    std::string id;
    std::string reason;
};

struct BatchResult
{
    int succeeded = 0;
    std::vector<BatchFailure> skipped; // reported and passed over (continue-on-error)
    std::optional<BatchFailure> fatal; // set when the run aborted
    std::vector<std::filesystem::path> written;

    bool aborted() const { return fatal.has_value(); }
    int exitCode() const { return aborted() ? 1 : 0; }
};

/**
 * Turns one request into archive bytes. ExtensionDownloader::fetch in
 * production.
 */
using Pipeline = std::function<std::vector<std::uint8_t>(const DownloadRequest &)>;

/**
 * Runs validate → output check → fetch → verify → write for each
 * identifier, strictly in input order, one at a time.
 *
 * A failing identifier is skipped when continueOnError is set; otherwise
 * the run stops there and later identifiers are never touched.
 */
class BatchRunner
{
public:
    /**
     * @param outputDir Directory for derived "{id}.zip" names (empty = cwd)
     */
    BatchRunner(BatchOptions options, Pipeline pipeline, std::filesystem::path outputDir = {});

    BatchResult run(const std::vector<std::string> &ids);

    std::filesystem::path outputPathFor(const std::string &id) const;

private:
    /**
     * Process one identifier. Throws on any failure; run() decides
     * whether that means skip or abort.
     */
    std::filesystem::path processOne(const std::string &id);

    BatchOptions options_;
    Pipeline pipeline_;
    std::filesystem::path outputDir_;
};

/**
 * Expand a --batch argument into identifiers.
 * A value containing a comma is a literal list; anything else is a file
 * with one identifier per line (blank lines and '#' comments skipped).
 *
 * @throws BatchSourceError if the file can't be read
 */
std::vector<std::string> parseBatchSource(const std::string &source);

/**
 * Identifiers for this run: the expanded --batch source when given,
 * otherwise the trimmed positional identifier. An empty batch gives an
 * empty list.
 *
 * @throws BatchSourceError if the batch file can't be read
 */
std::vector<std::string> collectIdentifiers(const std::optional<std::string> &positional,
                                            const std::optional<std::string> &batch);
