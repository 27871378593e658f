#include "progress_bar.hpp"

#include <unistd.h>

#include <fmt/core.h>

ProgressBar::ProgressBar(std::FILE *out)
    : out_(out), isTerminalOutput_(::isatty(fileno(out)) != 0)
{
    start();
}

void ProgressBar::start()
{
    startTime_ = std::chrono::steady_clock::now();
    lastPrintedTime_ = startTime_;
    lastPrintedPercentage_ = -1.0;
    drawn_ = false;
}

void ProgressBar::update(std::uint64_t downloaded, std::uint64_t total)
{
    auto now = std::chrono::steady_clock::now();
    auto sinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count();
    auto sinceLast = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();
    bool isComplete = (total > 0 && downloaded >= total);

    if (!isComplete)
    {
        // Don't show progress in the first 500ms (prevents flashing for instant downloads)
        if (sinceStart < 500)
        {
            return;
        }
        if (sinceLast < (isTerminalOutput_ ? 200 : 1000))
        {
            return;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    std::string line;

    if (total == 0)
    {
        line = fmt::format("Downloaded: {} | Elapsed: {}", formatBytes(downloaded),
                           formatDuration(static_cast<long>(elapsed)));
    }
    else
    {
        double percentage = (static_cast<double>(downloaded) / static_cast<double>(total)) * 100.0;

        // Avoid over-printing in non-terminal environments
        if (!isTerminalOutput_ && !isComplete && lastPrintedPercentage_ >= 0.0 &&
            percentage < lastPrintedPercentage_ + 1.0)
        {
            return;
        }

        double speed = (elapsed > 0) ? static_cast<double>(downloaded) / static_cast<double>(elapsed) : 0.0;
        long eta = (speed > 0 && downloaded < total) ? static_cast<long>(static_cast<double>(total - downloaded) / speed) : 0;

        line = fmt::format("{} {:.1f}% | {} / {} | {}/s | ETA: {}", renderBar(percentage), percentage,
                           formatBytes(downloaded), formatBytes(total),
                           formatBytes(static_cast<std::uint64_t>(speed)), formatDuration(eta));
        lastPrintedPercentage_ = percentage;
    }

    if (isTerminalOutput_)
    {
        fmt::print(out_, "\r{}\033[K", line);
        std::fflush(out_);
    }
    else
    {
        fmt::print(out_, "{}\n", line);
    }
    lastPrintedTime_ = now;
    drawn_ = true;
}

void ProgressBar::finish()
{
    if (drawn_ && isTerminalOutput_)
    {
        fmt::print(out_, "\n");
    }
    drawn_ = false;
}

ProgressCallback ProgressBar::callback()
{
    return [this](std::uint64_t downloaded, std::uint64_t total) { update(downloaded, total); };
}

std::string ProgressBar::renderBar(double percentage) const
{
    int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
    std::string bar = "[";
    for (int i = 0; i < BAR_WIDTH; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    double value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}
