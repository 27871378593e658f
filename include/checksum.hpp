#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * Archive integrity checks using cryptographic hashes.
 * Only SHA-256 is supported.
 */
class ChecksumVerifier
{
public:
    enum class Algorithm
    {
        SHA256
    };

    /**
     * Compute SHA-256 of an in-memory buffer.
     *
     * @return Hex-encoded hash string (64 characters)
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string computeSHA256(const std::vector<std::uint8_t> &data);

    /**
     * Check a buffer against an expected checksum.
     *
     * @param expectedChecksum Expected hash in format "algorithm:hexhash"
     *                         Example: "sha256:abc123..."
     * @return true if checksums match, false otherwise
     * @throws std::runtime_error if format is invalid or algorithm unsupported
     */
    static bool verify(const std::vector<std::uint8_t> &data, const std::string &expectedChecksum);

    /**
     * Parse checksum string into algorithm and hash.
     * Format: "algorithm:hexhash"
     *
     * @throws std::runtime_error if format is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const unsigned char *data, std::size_t size);

    /**
     * Lowercase and strip whitespace so comparison is case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);
};
