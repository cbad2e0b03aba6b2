#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "download_scheduler.hpp"

/**
 * Terminal rendering of the scheduler's progress table.
 *
 * On a terminal the line is redrawn in place at most 5 times per second;
 * when output is piped, a new line is printed at most once per second and
 * only when the percentage moved by a whole point.
 */
class ProgressRenderer
{
public:
    explicit ProgressRenderer(std::int64_t totalBytes);

    /**
     * Suitable as a ProgressCallback.
     */
    void update(const std::vector<ProgressSnapshot> &table);

    /**
     * Print the final state and end the line.
     */
    void finish();

    /**
     * Render one status line; exposed for testing.
     */
    static std::string renderLine(std::int64_t done,
                                  std::int64_t total,
                                  int finishedChunks,
                                  int totalChunks,
                                  double speed,
                                  long eta);

private:
    void print(const std::string &line);

    std::int64_t totalBytes_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    double lastPrintedPercentage_ = -1.0;
    bool isTerminalOutput_ = true;
    bool printedAnything_ = false;
};
