#include "log.hpp"

#include <atomic>
#include <cstdio>

namespace logging
{
    namespace
    {
        std::atomic<bool> verboseEnabled{false};
        std::mutex outputMutex;
    }

    void setVerbose(bool enabled)
    {
        verboseEnabled.store(enabled);
    }

    bool isVerbose()
    {
        return verboseEnabled.load();
    }

    void writeLine(const std::string &line)
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        fmt::print(stderr, "{}\n", line);
        std::fflush(stderr);
    }
}
