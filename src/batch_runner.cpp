#include "batch_runner.hpp"
#include "archive_writer.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "extension_id.hpp"

#include <fstream>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{
std::string trim(const std::string &value)
{
    const char *whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return "";
    }
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}
} // namespace

BatchRunner::BatchRunner(BatchOptions options, Pipeline pipeline, std::filesystem::path outputDir)
    : options_(std::move(options)), pipeline_(std::move(pipeline)), outputDir_(std::move(outputDir))
{
}

BatchResult BatchRunner::run(const std::vector<std::string> &ids)
{
    BatchResult result;

    for (size_t i = 0; i < ids.size(); ++i)
    {
        const std::string &id = ids[i];
        spdlog::info("Processing {}/{}: {}", i + 1, ids.size(), id);

        std::string reason;
        bool preflight = false;
        try
        {
            result.written.push_back(processOne(id));
            ++result.succeeded;
            continue;
        }
        // Validation and existing-output problems carry their own wording
        catch (const InvalidIdentifierError &e)
        {
            reason = e.what();
            preflight = true;
        }
        catch (const OutputExistsError &e)
        {
            reason = e.what();
            preflight = true;
        }
        catch (const std::exception &e)
        {
            reason = fmt::format("Failed for {}: {}", id, e.what());
        }

        if (!options_.continueOnError)
        {
            spdlog::error("{}", reason);
            result.fatal = BatchFailure{id, reason};
            return result;
        }

        if (preflight)
        {
            spdlog::warn("{} Skipping.", reason);
        }
        else
        {
            spdlog::error("{}. Continuing.", reason);
        }
        result.skipped.push_back(BatchFailure{id, reason});
    }

    return result;
}

std::filesystem::path BatchRunner::outputPathFor(const std::string &id) const
{
    if (options_.output)
    {
        return *options_.output;
    }
    return outputDir_ / (id + ".zip");
}

std::filesystem::path BatchRunner::processOne(const std::string &id)
{
    // 1. Syntax check before any network traffic
    ExtensionIdValidator::require(id, options_.platform);

    // 2. Refuse to clobber unless forced
    std::filesystem::path outFile = outputPathFor(id);
    if (std::filesystem::exists(outFile) && !options_.force)
    {
        throw OutputExistsError(fmt::format("Output file {} already exists. Use --force to overwrite.", outFile.string()));
    }

    // 3. Resolve, fetch, normalize
    std::vector<std::uint8_t> archive = pipeline_(DownloadRequest{id, options_.platform, options_.version});

    // 4. Verify, then write
    std::string sha256 = ChecksumVerifier::computeSHA256(archive);
    if (options_.expectedChecksum && !ChecksumVerifier::verify(archive, *options_.expectedChecksum))
    {
        throw ChecksumMismatchError(fmt::format("Checksum mismatch: expected {}, got sha256:{}",
                                                *options_.expectedChecksum, sha256));
    }

    ArchiveWriter::write(outFile, archive);
    spdlog::info("Saved → {} (sha256:{})", std::filesystem::absolute(outFile).string(), sha256);
    return outFile;
}

std::vector<std::string> parseBatchSource(const std::string &source)
{
    std::vector<std::string> ids;

    if (source.find(',') != std::string::npos)
    {
        size_t start = 0;
        while (start <= source.size())
        {
            size_t comma = source.find(',', start);
            if (comma == std::string::npos)
            {
                comma = source.size();
            }
            std::string id = trim(source.substr(start, comma - start));
            if (!id.empty())
            {
                ids.push_back(std::move(id));
            }
            start = comma + 1;
        }
        return ids;
    }

    std::ifstream file(source);
    if (!file)
    {
        throw BatchSourceError(fmt::format("Batch file {} not found.", source));
    }

    std::string line;
    while (std::getline(file, line))
    {
        std::string id = trim(line);
        if (!id.empty() && id.front() != '#')
        {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

std::vector<std::string> collectIdentifiers(const std::optional<std::string> &positional,
                                            const std::optional<std::string> &batch)
{
    if (batch)
    {
        return parseBatchSource(*batch);
    }
    if (positional)
    {
        // Kept even when blank so validation reports it
        return {trim(*positional)};
    }
    return {};
}
