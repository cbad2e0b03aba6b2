#pragma once

#include <mutex>
#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Minimal diagnostics for the downloader.
 * Everything goes to stderr through fmt; worker threads log concurrently,
 * so each line is printed under a single mutex.
 */
namespace logging
{
    void setVerbose(bool enabled);
    bool isVerbose();

    // Writes one complete line to stderr
    void writeLine(const std::string &line);

    /**
     * Print only when --verbose was given.
     */
    template <typename... Args>
    void verbose(fmt::format_string<Args...> format, Args &&...args)
    {
        if (!isVerbose())
        {
            return;
        }
        writeLine(fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> format, Args &&...args)
    {
        writeLine("Warning: " + fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        writeLine("Error: " + fmt::format(format, std::forward<Args>(args)...));
    }
}
