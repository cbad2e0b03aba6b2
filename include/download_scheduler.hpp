#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "chunk_planner.hpp"
#include "concurrency.hpp"
#include "http_client.hpp"
#include "staging_file.hpp"

/**
 * Latest known position of one chunk; begin <= current <= end.
 */
struct ProgressSnapshot
{
    int chunkId = 0;
    std::int64_t begin = 0;
    std::int64_t end = 0;
    std::int64_t current = 0;
};

/**
 * Receives the full table of snapshots (one per chunk, in chunk order)
 * each time any chunk advances. Always called from the same thread.
 */
using ProgressCallback = std::function<void(const std::vector<ProgressSnapshot> &)>;

/**
 * Runs one worker thread per chunk until every chunk is in the staging file.
 *
 * Concurrency is gated by a token pool holding one token per chunk. A worker
 * takes a token, tries the mirrors round-robin starting at its own index and
 * keeps the token whether it succeeds or not. Only a finished chunk returns a
 * token to the pool, which lets a worker whose mirrors all failed try again
 * on capacity freed elsewhere. Every full round of failed mirrors counts
 * against a single session-wide budget equal to the chunk count; reaching
 * it aborts the session.
 *
 * Workers never touch the counters: they post Done/Failed/Fatal events and
 * the coordinator (the thread calling run()) owns all the bookkeeping.
 */
class DownloadScheduler
{
public:
    // Transfer block size; each block is one pwrite and one progress update
    static constexpr size_t BLOCK_SIZE = 4096;

    /**
     * @param mirrors   Ordered mirror URLs (>= 1)
     * @param chunks    Chunk table from planChunks; one worker per chunk
     * @param file      Pre-sized staging file; committed on success
     * @param transport Shared HTTP transport
     * @param timeout   Limit for each ranged request
     */
    DownloadScheduler(std::vector<std::string> mirrors,
                      std::vector<Chunk> chunks,
                      StagingFile &file,
                      HttpTransport &transport,
                      std::chrono::milliseconds timeout);

    DownloadScheduler(const DownloadScheduler &) = delete;
    DownloadScheduler &operator=(const DownloadScheduler &) = delete;

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    /**
     * Download every chunk, then rename the staging file to its final name.
     * Returns only after all worker threads have exited.
     *
     * @throws DownloadError(ExhaustedMirrors) when cumulative failures reach the chunk count
     * @throws DownloadError(LocalWriteError) on a disk write failure
     * @throws DownloadError(IOError) if the final rename fails
     */
    void run();

    int completedChunks() const { return completedChunks_; }
    int cumulativeFailures() const { return cumulativeFailures_; }

private:
    enum class EventType
    {
        Done,
        Failed,
        Fatal
    };

    struct WorkerEvent
    {
        EventType type = EventType::Failed;
        int chunkId = 0;
        std::string message;
    };

    enum class AttemptResult
    {
        Completed,
        Failed,
        Fatal,
        Cancelled
    };

    void worker(int index);

    AttemptResult downloadFrom(const Chunk &chunk, const std::string &mirror, std::string &fatalMessage);

    void reportProgress(const Chunk &chunk, std::int64_t current);

    void aggregateProgress();

    void stopWorkers(std::vector<std::thread> &workers);

    std::vector<std::string> mirrors_;
    std::vector<Chunk> chunks_;
    StagingFile &file_;
    HttpTransport &transport_;
    std::chrono::milliseconds timeout_;
    ProgressCallback progressCallback_;

    TokenPool tokens_;
    EventQueue<WorkerEvent> events_;
    EventQueue<ProgressSnapshot> progress_;
    std::atomic<bool> cancelled_{false};

    // Coordinator-only state
    bool started_ = false;
    int completedChunks_ = 0;
    int cumulativeFailures_ = 0;
};
