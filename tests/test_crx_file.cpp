#include "test_helpers.hpp"

#include "crx_file.hpp"
#include "errors.hpp"

using namespace testing_support;
using namespace std::string_literals;

namespace
{
std::vector<std::uint8_t> makeCrx(std::uint32_t version, std::uint32_t headerLength,
                                  const std::vector<std::uint8_t> &headerAndPayload)
{
    std::vector<std::uint8_t> crx = {'C', 'r', '2', '4'};
    for (std::uint32_t field : {version, headerLength})
    {
        crx.push_back(static_cast<std::uint8_t>(field & 0xFF));
        crx.push_back(static_cast<std::uint8_t>((field >> 8) & 0xFF));
        crx.push_back(static_cast<std::uint8_t>((field >> 16) & 0xFF));
        crx.push_back(static_cast<std::uint8_t>((field >> 24) & 0xFF));
    }
    crx.insert(crx.end(), headerAndPayload.begin(), headerAndPayload.end());
    return crx;
}

bool isKind(const PackageFormatError &e, PackageFormatError::Kind kind)
{
    return e.kind() == kind;
}
} // namespace

int main()
{
    quietLogs();

    const std::vector<std::uint8_t> payload = bytes("PK\x03\x04 archive body");

    // Test 1: Empty header exposes the payload at offset 12
    {
        auto archive = CrxFile::extractArchive(makeCrx(3, 0, payload));
        check(archive == payload, "zero-length header returns payload unchanged");
    }

    // Test 2: Header bytes are skipped
    {
        std::vector<std::uint8_t> body = bytes("\x0a\x0b\x0c\x0d\x0e");
        body.insert(body.end(), payload.begin(), payload.end());
        auto crx = makeCrx(3, 5, body);
        check(CrxFile::extractArchive(crx) == payload, "suffix starts at 12 + header length");
        check(CrxFile::formatVersion(crx) == 3, "format version read little-endian");
    }

    // Test 3: Header that exactly consumes the input leaves an empty archive
    {
        auto crx = makeCrx(3, 4, bytes("abcd"));
        check(CrxFile::extractArchive(crx).empty(), "offset == size yields empty archive");
    }

    // Test 4: Bad magic
    checkThrows<PackageFormatError>(
        []() { CrxFile::extractArchive(bytes("ABCD\x03\x00\x00\x00\x00\x00\x00\x00PK"s)); },
        "ABCD magic is rejected as bad magic",
        [](const PackageFormatError &e) {
            return isKind(e, PackageFormatError::Kind::BadMagic) && contains(e.what(), "bad magic");
        });
    checkThrows<PackageFormatError>(
        []() { CrxFile::extractArchive({}); },
        "empty input is rejected as bad magic",
        [](const PackageFormatError &e) { return isKind(e, PackageFormatError::Kind::BadMagic); });
    checkThrows<PackageFormatError>(
        [&]() { CrxFile::extractArchive(payload); },
        "plain zip is rejected as bad magic",
        [](const PackageFormatError &e) { return isKind(e, PackageFormatError::Kind::BadMagic); });

    // Test 5: Truncated prefix
    checkThrows<PackageFormatError>(
        []() { CrxFile::extractArchive(bytes("Cr24\x03\x00\x00\x00"s)); },
        "8-byte input is truncated",
        [](const PackageFormatError &e) {
            return isKind(e, PackageFormatError::Kind::Truncated) && contains(e.what(), "truncated");
        });

    // Test 6: Header length past the end
    checkThrows<PackageFormatError>(
        [&]() { CrxFile::extractArchive(makeCrx(3, static_cast<std::uint32_t>(payload.size() + 1), payload)); },
        "header length one past the end is corrupt",
        [](const PackageFormatError &e) {
            return isKind(e, PackageFormatError::Kind::CorruptHeaderLength) &&
                   contains(e.what(), "corrupt header length");
        });
    checkThrows<PackageFormatError>(
        [&]() { CrxFile::extractArchive(makeCrx(3, 0xFFFFFFFFu, payload)); },
        "maximum header length does not wrap around",
        [](const PackageFormatError &e) { return isKind(e, PackageFormatError::Kind::CorruptHeaderLength); });

    return finish();
}
