#include "download_scheduler.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"

DownloadScheduler::DownloadScheduler(std::vector<std::string> mirrors,
                                     std::vector<Chunk> chunks,
                                     StagingFile &file,
                                     HttpTransport &transport,
                                     std::chrono::milliseconds timeout)
    : mirrors_(std::move(mirrors)),
      chunks_(std::move(chunks)),
      file_(file),
      transport_(transport),
      timeout_(timeout),
      tokens_(static_cast<int>(chunks_.size())) // All workers may start at once
{
    if (mirrors_.empty())
    {
        throw DownloadError(ErrorCode::NoMirrors, "No URLs provided");
    }
    if (chunks_.empty())
    {
        throw std::invalid_argument("Chunk table must not be empty");
    }
}

void DownloadScheduler::run()
{
    if (started_)
    {
        throw std::logic_error("DownloadScheduler::run called twice");
    }
    started_ = true;

    const int numChunks = static_cast<int>(chunks_.size());
    std::vector<std::thread> workers;
    workers.reserve(chunks_.size());
    std::thread aggregator;

    try
    {
        if (progressCallback_)
        {
            aggregator = std::thread(&DownloadScheduler::aggregateProgress, this);
        }
        for (int i = 0; i < numChunks; ++i)
        {
            workers.emplace_back(&DownloadScheduler::worker, this, i);
        }
    }
    catch (const std::system_error &)
    {
        stopWorkers(workers);
        progress_.close();
        if (aggregator.joinable())
        {
            aggregator.join();
        }
        throw;
    }

    std::optional<DownloadError> failure;
    int remaining = numChunks;

    // Block until a worker either succeeded or failed
    while (remaining > 0 && !failure)
    {
        std::optional<WorkerEvent> event = events_.pop();
        if (!event)
        {
            break;
        }

        switch (event->type)
        {
        case EventType::Done:
            --remaining;
            ++completedChunks_;
            tokens_.release(); // Lets a failed worker retry on the freed capacity
            logging::verbose("Chunk {} done ({} remaining)", event->chunkId, remaining);
            break;

        case EventType::Failed:
            ++cumulativeFailures_;
            logging::verbose("Chunk {} failed on every mirror ({}/{} failures)",
                             event->chunkId, cumulativeFailures_, numChunks);
            if (cumulativeFailures_ >= numChunks)
            {
                failure.emplace(ErrorCode::ExhaustedMirrors,
                                "The file couldn't be downloaded from any source. Aborting.");
            }
            break;

        case EventType::Fatal:
            failure.emplace(ErrorCode::LocalWriteError, event->message);
            break;
        }
    }

    if (failure)
    {
        cancelled_.store(true);
    }
    stopWorkers(workers);

    progress_.close();
    if (aggregator.joinable())
    {
        aggregator.join();
    }

    if (failure)
    {
        logging::verbose("Session aborted, staging file left at {}", file_.partPath().string());
        throw *failure;
    }

    file_.commit();
    logging::verbose("Saved {}", file_.finalPath().string());
}

void DownloadScheduler::stopWorkers(std::vector<std::thread> &workers)
{
    // Wakes workers still waiting for a token; they exit instead of retrying
    tokens_.close();
    for (auto &worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

void DownloadScheduler::worker(int index)
{
    const Chunk &chunk = chunks_[static_cast<size_t>(index)];
    const int numMirrors = static_cast<int>(mirrors_.size());

    try
    {
        // Block until there is a token (all workers get one at first)
        while (tokens_.acquire())
        {
            if (chunk.empty())
            {
                events_.push({EventType::Done, index, {}});
                return;
            }

            for (int attempt = 0; attempt < numMirrors; ++attempt)
            {
                if (cancelled_.load())
                {
                    return;
                }

                // Round-robin, offset by the worker's own index
                const std::string &mirror = mirrors_[static_cast<size_t>((index + attempt) % numMirrors)];

                std::string fatalMessage;
                switch (downloadFrom(chunk, mirror, fatalMessage))
                {
                case AttemptResult::Completed:
                    events_.push({EventType::Done, index, {}});
                    return;
                case AttemptResult::Fatal:
                    events_.push({EventType::Fatal, index, fatalMessage});
                    return;
                case AttemptResult::Cancelled:
                    return;
                case AttemptResult::Failed:
                    break;
                }
            }

            // Every mirror failed; the token is kept, so the next try waits for a finished chunk
            events_.push({EventType::Failed, index, {}});
        }
    }
    catch (const std::exception &e)
    {
        events_.push({EventType::Fatal, index, fmt::format("Worker for chunk {} failed: {}", index, e.what())});
    }
}

DownloadScheduler::AttemptResult DownloadScheduler::downloadFrom(const Chunk &chunk,
                                                                 const std::string &mirror,
                                                                 std::string &fatalMessage)
{
    std::vector<char> block;
    block.reserve(BLOCK_SIZE);
    std::int64_t cursor = chunk.begin;
    bool overrun = false;
    bool writeFailed = false;

    // Write the buffered block at the chunk cursor
    auto flush = [&]() -> bool
    {
        if (block.empty())
        {
            return true;
        }
        try
        {
            file_.writeAt(block.data(), block.size(), cursor);
        }
        catch (const DownloadError &e)
        {
            writeFailed = true;
            fatalMessage = e.what();
            return false;
        }
        cursor += static_cast<std::int64_t>(block.size());
        block.clear();
        reportProgress(chunk, cursor);
        return true;
    };

    RangeRequest request;
    request.url = mirror;
    request.first = chunk.begin;
    request.last = chunk.end - 1;
    request.allowFullResponse = chunk.begin == 0 && chunk.end == file_.length();
    request.timeout = timeout_;
    request.isCancelled = [this]()
    { return cancelled_.load(); };
    request.onData = [&](const char *data, size_t size) -> bool
    {
        if (cancelled_.load())
        {
            return false;
        }
        // A server that sends more than asked would spill into the next chunk
        if (cursor + static_cast<std::int64_t>(block.size() + size) > chunk.end)
        {
            overrun = true;
            return false;
        }
        while (size > 0)
        {
            size_t n = std::min(size, BLOCK_SIZE - block.size());
            block.insert(block.end(), data, data + n);
            data += n;
            size -= n;
            if (block.size() == BLOCK_SIZE && !flush())
            {
                return false;
            }
        }
        return true;
    };

    RangeResponse response;
    try
    {
        response = transport_.getRange(request);
    }
    catch (const std::exception &e)
    {
        logging::verbose("Chunk {}: request to {} could not be made: {}", chunk.index, mirror, e.what());
        return AttemptResult::Failed;
    }

    if (writeFailed)
    {
        return AttemptResult::Fatal;
    }
    if (cancelled_.load())
    {
        return AttemptResult::Cancelled;
    }
    if (overrun)
    {
        logging::verbose("Chunk {}: {} sent more than bytes={}-{}", chunk.index, mirror, request.first, request.last);
        return AttemptResult::Failed;
    }
    if (response.status != TransferStatus::Completed)
    {
        logging::verbose("Chunk {}: {} failed: {}", chunk.index, mirror, response.error);
        return AttemptResult::Failed;
    }

    if (!flush())
    {
        return AttemptResult::Fatal;
    }
    if (cursor != chunk.end)
    {
        logging::verbose("Chunk {}: {} ended after {} of {} bytes",
                         chunk.index, mirror, cursor - chunk.begin, chunk.size());
        return AttemptResult::Failed;
    }

    return AttemptResult::Completed;
}

void DownloadScheduler::reportProgress(const Chunk &chunk, std::int64_t current)
{
    if (!progressCallback_)
    {
        return;
    }
    progress_.push({chunk.index, chunk.begin, chunk.end, current});
}

void DownloadScheduler::aggregateProgress()
{
    const size_t numChunks = chunks_.size();
    std::vector<ProgressSnapshot> table;
    table.reserve(numChunks);
    for (const auto &chunk : chunks_)
    {
        table.push_back({chunk.index, chunk.begin, chunk.end, chunk.begin});
    }

    // A chunk at its end may still be retried, so run until every worker has
    // exited and the queue is closed
    while (std::optional<ProgressSnapshot> snapshot = progress_.pop())
    {
        table[static_cast<size_t>(snapshot->chunkId)] = *snapshot;

        try
        {
            progressCallback_(table);
        }
        catch (const std::exception &e)
        {
            logging::warning("Progress callback failed: {}", e.what());
        }
    }
}
