#include "chunk_planner.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>

namespace
{
    bool coversExactly(const std::vector<Chunk> &chunks, std::int64_t length, int workers)
    {
        if (static_cast<int>(chunks.size()) != workers)
        {
            return false;
        }
        if (chunks.front().begin != 0 || chunks.back().end != length)
        {
            return false;
        }

        std::int64_t smallest = chunks.front().size();
        std::int64_t largest = chunks.front().size();
        for (size_t i = 0; i < chunks.size(); ++i)
        {
            if (chunks[i].index != static_cast<int>(i) || chunks[i].end < chunks[i].begin)
            {
                return false;
            }
            if (i > 0 && chunks[i].begin != chunks[i - 1].end)
            {
                return false; // Gap or overlap
            }
            // Larger chunks come first
            if (i > 0 && chunks[i].size() > chunks[i - 1].size())
            {
                return false;
            }
            smallest = std::min(smallest, chunks[i].size());
            largest = std::max(largest, chunks[i].size());
        }
        return largest - smallest <= 1;
    }

    bool sameTable(const std::vector<Chunk> &a, const std::vector<Chunk> &b)
    {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const Chunk &x, const Chunk &y)
                          { return x.index == y.index && x.begin == y.begin && x.end == y.end &&
                                   x.ownerMirrorHint == y.ownerMirrorHint; });
    }
}

int main()
{
    TestReport report("chunk planner");

    // Coverage over a grid of lengths and worker counts
    const std::int64_t lengths[] = {0, 1, 2, 7, 10, 99, 100, 4096, 1 << 20, 10 * 1024 * 1024 + 3, 5000000000LL};
    const int workerCounts[] = {1, 2, 3, 7, 8, 16, 64};
    bool allCovered = true;
    for (std::int64_t length : lengths)
    {
        for (int workers : workerCounts)
        {
            if (!coversExactly(planChunks(length, workers, 3), length, workers))
            {
                fmt::print("  coverage broken for length={} workers={}\n", length, workers);
                allCovered = false;
            }
        }
    }
    report.check(allCovered, "Chunks are contiguous, start at 0, end at length, differ by <= 1");

    // Remainder goes to the earliest chunks
    auto table = planChunks(10, 3);
    report.check(table.size() == 3 &&
                     table[0].begin == 0 && table[0].end == 4 &&
                     table[1].begin == 4 && table[1].end == 7 &&
                     table[2].begin == 7 && table[2].end == 10,
                 "10 bytes / 3 workers -> [0,4) [4,7) [7,10)");

    report.check(sameTable(planChunks(10 * 1024 * 1024, 8, 3), planChunks(10 * 1024 * 1024, 8, 3)),
                 "Same (length, N) yields the same table");

    auto tiny = planChunks(3, 5);
    report.check(tiny.size() == 5 && tiny[3].empty() && tiny[4].empty() && tiny[2].end == 3,
                 "Length below N yields trailing empty chunks");

    auto hints = planChunks(100, 5, 2);
    report.check(hints[0].ownerMirrorHint == 0 && hints[1].ownerMirrorHint == 1 &&
                     hints[2].ownerMirrorHint == 0 && hints[4].ownerMirrorHint == 0,
                 "Owner mirror hint is index mod mirror count");

    bool threwOnZeroWorkers = false;
    try
    {
        planChunks(100, 0);
    }
    catch (const std::invalid_argument &)
    {
        threwOnZeroWorkers = true;
    }
    report.check(threwOnZeroWorkers, "Zero workers is rejected");

    bool threwOnNegativeLength = false;
    try
    {
        planChunks(-1, 2);
    }
    catch (const std::invalid_argument &)
    {
        threwOnNegativeLength = true;
    }
    report.check(threwOnNegativeLength, "Negative length is rejected");

    return report.summary();
}
