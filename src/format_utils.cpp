#include "format_utils.hpp"

#include <fmt/core.h>

std::string formatBytes(std::int64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(long seconds)
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
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

std::string formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
    }
    else if (bytesPerSecond >= 1024)
    {
        return fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    }
    return fmt::format("{:.0f} B/s", bytesPerSecond);
}
