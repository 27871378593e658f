#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * CRX3 package handling.
 *
 * Layout: "Cr24" magic, uint32 format version, uint32 header length
 * (both little-endian), header bytes, then a plain ZIP archive.
 */
class CrxFile
{
public:
    /**
     * Strip the CRX header and return the embedded archive.
     * The archive itself is not validated.
     *
     * @param crx Raw package bytes
     * @return Bytes from offset 12 + header length to the end
     * @throws PackageFormatError on bad magic, truncated input or a header
     *         length pointing past the end
     */
    static std::vector<std::uint8_t> extractArchive(const std::vector<std::uint8_t> &crx);

    /**
     * Format version field (bytes 4..8). Caller must have checked the magic.
     */
    static std::uint32_t formatVersion(const std::vector<std::uint8_t> &crx);

    static constexpr std::size_t PREFIX_SIZE = 12; // magic + version + header length

private:
    static std::uint32_t readLE32(const std::vector<std::uint8_t> &data, std::size_t offset);
};
