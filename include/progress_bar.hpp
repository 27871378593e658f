#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

#include "http_client.hpp"

/**
 * Console progress display for package downloads.
 * On a terminal the bar is redrawn in place at most 5 times per second;
 * otherwise one line is printed per percent (or per second when the size
 * is unknown).
 */
class ProgressBar
{
public:
    explicit ProgressBar(std::FILE *out = stderr);

    /**
     * Reset timers and counters for a new transfer.
     */
    void start();

    void update(std::uint64_t downloaded, std::uint64_t total);

    /**
     * Terminate the in-place line if anything was drawn.
     */
    void finish();

    /**
     * Callback bound to this bar, to hand to HttpClient::get().
     * The bar must outlive the returned function.
     */
    ProgressCallback callback();

    /**
     * Format bytes into human-readable string (e.g., "52.3 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

private:
    std::string renderBar(double percentage) const;

    std::FILE *out_;
    bool isTerminalOutput_;
    bool drawn_ = false;
    double lastPrintedPercentage_ = -1.0;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;

    static constexpr int BAR_WIDTH = 40;
};
