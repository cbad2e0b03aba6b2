#include "progress_bar.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

#include "format_utils.hpp"

namespace
{
    constexpr int BAR_WIDTH = 40;
}

ProgressRenderer::ProgressRenderer(std::int64_t totalBytes)
    : totalBytes_(totalBytes),
      startTime_(std::chrono::steady_clock::now()),
      lastPrintedTime_(startTime_)
{
    // Detect if stdout is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

std::string ProgressRenderer::renderLine(std::int64_t done,
                                         std::int64_t total,
                                         int finishedChunks,
                                         int totalChunks,
                                         double speed,
                                         long eta)
{
    double percentage = total > 0 ? (static_cast<double>(done) / total) * 100.0 : 100.0;

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

    return fmt::format("{} {:.1f}% | {} / {} | {} | ETA: {} | chunks {}/{}",
                       bar,
                       percentage,
                       formatBytes(done),
                       formatBytes(total),
                       formatSpeed(speed),
                       formatDuration(eta),
                       finishedChunks,
                       totalChunks);
}

void ProgressRenderer::update(const std::vector<ProgressSnapshot> &table)
{
    std::int64_t done = 0;
    int finishedChunks = 0;
    for (const auto &snapshot : table)
    {
        done += snapshot.current - snapshot.begin;
        if (snapshot.current >= snapshot.end)
        {
            ++finishedChunks;
        }
    }

    auto now = std::chrono::steady_clock::now();
    bool isComplete = done >= totalBytes_;
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();
    double percentage = totalBytes_ > 0 ? (static_cast<double>(done) / totalBytes_) * 100.0 : 100.0;

    if (!isComplete)
    {
        if (isTerminalOutput_ && sinceLastPrint < 200)
        {
            return;
        }
        if (!isTerminalOutput_ &&
            (sinceLastPrint < 1000 || (lastPrintedPercentage_ >= 0.0 && percentage < lastPrintedPercentage_ + 1.0)))
        {
            return;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    double speed = elapsed > 0 ? static_cast<double>(done) / elapsed : 0.0;
    long eta = speed > 0 ? static_cast<long>((totalBytes_ - done) / speed) : -1;

    print(renderLine(done, totalBytes_, finishedChunks, static_cast<int>(table.size()), speed, eta));
    lastPrintedTime_ = now;
    lastPrintedPercentage_ = percentage;
}

void ProgressRenderer::print(const std::string &line)
{
    printedAnything_ = true;
    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", line);
    }
}

void ProgressRenderer::finish()
{
    if (printedAnything_ && isTerminalOutput_)
    {
        fmt::print("\n");
    }
}
