#include "test_helpers.hpp"

#include "progress_bar.hpp"

using namespace testing_support;

int main()
{
    // Test 1: formatBytes
    check(ProgressBar::formatBytes(0) == "0 B", "zero bytes");
    check(ProgressBar::formatBytes(1023) == "1023 B", "just under a kilobyte");
    check(ProgressBar::formatBytes(1024) == "1.00 KB", "one kilobyte");
    check(ProgressBar::formatBytes(1536) == "1.50 KB", "fractional kilobytes");
    check(ProgressBar::formatBytes(5ULL * 1024 * 1024) == "5.00 MB", "megabytes");
    check(ProgressBar::formatBytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB", "gigabytes");

    // Test 2: formatDuration
    check(ProgressBar::formatDuration(-1) == "unknown", "negative duration");
    check(ProgressBar::formatDuration(0) == "0s", "zero seconds");
    check(ProgressBar::formatDuration(59) == "59s", "seconds only");
    check(ProgressBar::formatDuration(61) == "1m 1s", "minutes and seconds");
    check(ProgressBar::formatDuration(3600) == "1h 0m", "one hour");
    check(ProgressBar::formatDuration(3 * 3600 + 125) == "3h 2m", "hours and minutes");

    return finish();
}
