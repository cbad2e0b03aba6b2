#pragma once

#include <cstdint>
#include <vector>

/**
 * A contiguous byte range of the target file owned by exactly one worker.
 * begin is inclusive, end is exclusive.
 */
struct Chunk
{
    int index = 0;
    std::int64_t begin = 0;
    std::int64_t end = 0;
    int ownerMirrorHint = 0; // index mod numMirrors, informational

    std::int64_t size() const { return end - begin; }
    bool empty() const { return end <= begin; }
};

/**
 * Split [0, length) into exactly `workers` chunks.
 *
 * Sizes differ by at most one byte: the remainder of length / workers is
 * handed out one byte at a time to the earliest chunks. The result depends
 * only on the arguments.
 *
 * @param length     File length in bytes (>= 0)
 * @param workers    Number of chunks to produce (>= 1)
 * @param numMirrors Number of mirrors, used for ownerMirrorHint (>= 1)
 * @throws std::invalid_argument on out-of-range arguments
 */
std::vector<Chunk> planChunks(std::int64_t length, int workers, int numMirrors = 1);
