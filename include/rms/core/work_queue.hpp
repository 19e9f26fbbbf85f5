/**
 * @file work_queue.hpp
 * @brief Blocking FIFO shared between a producer and a pool of workers
 *
 * EXAMPLE:
 * WorkQueue<ChunkJob> queue;
 * queue.push(job);               // scheduler
 * while (auto job = queue.pop()) // worker, returns nullopt after close()
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace rms {

/**
 * @brief Thread-safe FIFO with close semantics
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - close() wakes every blocked consumer; items already queued are still
 *   handed out, then pop() returns nullopt
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// Returns false when the queue is closed and the item was dropped.
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front();
    }

    /// Blocks until an item is available or the queue is closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_front();
    }

    /**
     * @brief Drop every queued item matching pred
     *
     * RETURNS: number of items removed
     */
    template<typename Pred>
    std::size_t erase_if(Pred pred) {
        std::unique_lock lock(mutex_);
        std::size_t removed = 0;
        for (auto it = queue_.begin(); it != queue_.end();) {
            if (pred(*it)) {
                it = queue_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace rms
