#include "checksum.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

// OpenSSL EVP digest API
#include <openssl/evp.h>

std::string ChecksumVerifier::computeSHA256(const std::vector<std::uint8_t> &data)
{
    // RAII wrapper so the context is freed even if an exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    if (EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    return toHex(hash, hashLength);
}

bool ChecksumVerifier::verify(const std::vector<std::uint8_t> &data, const std::string &expectedChecksum)
{
    auto [algorithm, expectedHash] = parseChecksum(expectedChecksum);
    if (algorithm != Algorithm::SHA256)
    {
        throw std::runtime_error("Only SHA-256 is currently supported");
    }

    return expectedHash == computeSHA256(data);
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    // Expected format: "sha256:abc123..."
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (algorithmStr != "sha256")
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    std::string normalizedHex = normalizeHex(checksumString.substr(colonPos + 1));

    constexpr size_t expectedLength = 64; // 256 bits / 4 bits per hex digit
    if (normalizedHex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, normalizedHex.length()));
    }

    return {Algorithm::SHA256, normalizedHex};
}

std::string ChecksumVerifier::toHex(const unsigned char *data, std::size_t size)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < size; ++i)
    {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        auto uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (std::isxdigit(uch))
        {
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
