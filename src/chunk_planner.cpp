#include "chunk_planner.hpp"

#include <stdexcept>

#include <fmt/core.h>

std::vector<Chunk> planChunks(std::int64_t length, int workers, int numMirrors)
{
    if (workers < 1)
    {
        throw std::invalid_argument(fmt::format("Worker count must be at least 1, got {}", workers));
    }
    if (length < 0)
    {
        throw std::invalid_argument(fmt::format("File length must not be negative, got {}", length));
    }
    if (numMirrors < 1)
    {
        numMirrors = 1;
    }

    const std::int64_t n = workers;
    const std::int64_t baseSize = length / n;
    std::int64_t remainder = length % n;

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<size_t>(workers));

    std::int64_t boundary = 0;
    for (int i = 0; i < workers; ++i)
    {
        std::int64_t size = baseSize;
        if (remainder > 0)
        {
            ++size;
            --remainder;
        }

        Chunk chunk;
        chunk.index = i;
        chunk.begin = boundary;
        chunk.end = boundary + size;
        chunk.ownerMirrorHint = i % numMirrors;
        chunks.push_back(chunk);

        boundary = chunk.end;
    }

    return chunks;
}
