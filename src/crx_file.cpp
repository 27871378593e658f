#include "crx_file.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iterator>

namespace
{
constexpr std::uint8_t kMagic[4] = {'C', 'r', '2', '4'};
}

std::vector<std::uint8_t> CrxFile::extractArchive(const std::vector<std::uint8_t> &crx)
{
    if (crx.size() < sizeof(kMagic) || !std::equal(std::begin(kMagic), std::end(kMagic), crx.begin()))
    {
        throw PackageFormatError(PackageFormatError::Kind::BadMagic, "invalid package: bad magic");
    }
    if (crx.size() < PREFIX_SIZE)
    {
        throw PackageFormatError(PackageFormatError::Kind::Truncated, "invalid package: truncated");
    }

    // 64-bit so a length near UINT32_MAX can't wrap
    std::uint64_t offset = PREFIX_SIZE + static_cast<std::uint64_t>(readLE32(crx, 8));
    if (offset > crx.size())
    {
        throw PackageFormatError(PackageFormatError::Kind::CorruptHeaderLength,
                                 "invalid package: corrupt header length");
    }

    return std::vector<std::uint8_t>(crx.begin() + static_cast<std::ptrdiff_t>(offset), crx.end());
}

std::uint32_t CrxFile::formatVersion(const std::vector<std::uint8_t> &crx)
{
    if (crx.size() < 8)
    {
        throw PackageFormatError(PackageFormatError::Kind::Truncated, "invalid package: truncated");
    }
    return readLE32(crx, 4);
}

std::uint32_t CrxFile::readLE32(const std::vector<std::uint8_t> &data, std::size_t offset)
{
    return static_cast<std::uint32_t>(data[offset]) |
           (static_cast<std::uint32_t>(data[offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}
