#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

/**
 * Writes finished archives to disk.
 *
 * Data goes to "<path>.part" first and is renamed onto the destination
 * only after the write succeeded, so a failed run never leaves a truncated
 * archive under the final name.
 */
class ArchiveWriter
{
public:
    /**
     * @param destination Final file path (replaced if it exists)
     * @param data Archive bytes
     * @throws ExtensionFetchError if the directory can't be created or the
     *         file can't be written or renamed
     */
    static void write(const std::filesystem::path &destination, const std::vector<std::uint8_t> &data);

    /**
     * Generate the .part filename for a destination path.
     */
    static std::filesystem::path makePartPath(const std::filesystem::path &destination);

private:
    /**
     * Ensure the directory for a file path exists, creating it if needed.
     */
    static void ensureDirectoryExists(const std::filesystem::path &filePath);
};
