#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace Switchboard {

/**
 * @brief Thread-safe FIFO used to hand work from producer threads to one worker.
 *
 * After stop() the queue refuses new items and wakes every waiter; items that were
 * still queued are discarded.
 */
template <typename T>
class SynchronizedQueue {
public:
    bool push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryPop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Blocks until an item is available or the queue is stopped.
    std::optional<T> waitPop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopped_ || !items_.empty(); });
        if (stopped_) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    template <typename Rep, typename Period>
    std::optional<T> waitPopFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return stopped_ || !items_.empty(); })) {
            return std::nullopt;
        }
        if (stopped_) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool isStopped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool stopped_ = false;
};

} // namespace Switchboard
