#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * Counting pool of admission tokens.
 *
 * Holding a token means being allowed one active transfer attempt.
 * close() wakes every waiter and makes acquire() fail from then on;
 * it is how an aborted session releases its blocked workers.
 */
class TokenPool
{
public:
    explicit TokenPool(int initialTokens) : available_(initialTokens) {}

    TokenPool(const TokenPool &) = delete;
    TokenPool &operator=(const TokenPool &) = delete;

    /**
     * Block until a token is available or the pool is closed.
     * @return true if a token was taken, false if the pool was closed
     */
    bool acquire()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || available_ > 0; });
        if (closed_)
        {
            return false;
        }
        --available_;
        return true;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++available_;
        }
        cv_.notify_one();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    int available() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int available_;
    bool closed_ = false;
};

/**
 * Unbounded multi-producer queue with a blocking pop.
 * Producers never block, so a worker can always report even after the
 * consumer stopped listening.
 */
template <typename T>
class EventQueue
{
public:
    EventQueue() = default;

    EventQueue(const EventQueue &) = delete;
    EventQueue &operator=(const EventQueue &) = delete;

    void push(T value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    /**
     * Wait for the next item.
     * @return the item, or std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (items_.empty())
        {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};
