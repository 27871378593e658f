#include "archive_writer.hpp"
#include "errors.hpp"

#include <fstream>
#include <system_error>

#include <fmt/core.h>

void ArchiveWriter::write(const std::filesystem::path &destination, const std::vector<std::uint8_t> &data)
{
    ensureDirectoryExists(destination);

    std::filesystem::path partPath = makePartPath(destination);
    {
        std::ofstream outFile(partPath, std::ios::binary | std::ios::trunc);
        if (!outFile)
        {
            throw ExtensionFetchError(fmt::format("Cannot open file for writing: {}", partPath.string()));
        }

        outFile.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        outFile.close();
        if (!outFile)
        {
            std::error_code ignored;
            std::filesystem::remove(partPath, ignored);
            throw ExtensionFetchError(fmt::format("Failed to write {}", partPath.string()));
        }
    }

    // Rename .part to final filename (atomic on the same filesystem)
    std::error_code ec;
    std::filesystem::rename(partPath, destination, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(partPath, ignored);
        throw ExtensionFetchError(fmt::format("Failed to rename {} to {}: {}",
                                              partPath.string(), destination.string(), ec.message()));
    }
}

std::filesystem::path ArchiveWriter::makePartPath(const std::filesystem::path &destination)
{
    std::filesystem::path partPath = destination;
    partPath += ".part";
    return partPath;
}

void ArchiveWriter::ensureDirectoryExists(const std::filesystem::path &filePath)
{
    auto directory = filePath.parent_path();

    // File in current dir, nothing to create
    if (directory.empty())
    {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw ExtensionFetchError(fmt::format("Failed to create directory for {}: {}",
                                              filePath.string(), ec.message()));
    }
}
