#pragma once

#include <string>
#include <optional> // C++17 feature for optional values

/**
 * Source platform of an extension package.
 */
enum class Platform
{
    Chrome,
    Firefox
};

/**
 * Lowercase platform name as used on the command line ("chrome", "firefox").
 */
inline const char *platformName(Platform platform)
{
    return platform == Platform::Chrome ? "chrome" : "firefox";
}

// Network defaults (seconds)
constexpr int kMaxAttempts = 3;
constexpr int kCrxTimeoutSeconds = 30;
constexpr int kApiTimeoutSeconds = 30;
constexpr int kXpiTimeoutSeconds = 60;
constexpr int kVersionFeedTimeoutSeconds = 10;

/**
 * Configuration for the extension fetcher.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct FetchConfig
{
    // Positional identifier (optional when --batch is used)
    std::optional<std::string> extensionId;

    std::optional<std::string> output;  // Explicit output path, single id only
    std::optional<std::string> version; // Version override
    Platform platform = Platform::Chrome;

    // Batch source: comma-separated ids or a file with one id per line
    std::optional<std::string> batch;

    // Expected archive checksum, format "sha256:abc123..."
    std::optional<std::string> expectedChecksum;

    // Flags
    bool verbose = false;
    bool force = false;
    bool continueOnError = false;
    bool listVersions = false;
    bool noProgress = false;
};
