#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace rms {

/**
 * @brief One-shot cancellation signal shared between a transfer and its owner
 *
 * cancel() wakes every wait_for() and runs the registered callbacks exactly
 * once. Callbacks run under the token lock so that remove_callback()
 * returning means the callback is not running and never will; a callback
 * must therefore not touch the token itself.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true)) {
            return;
        }
        cv_.notify_all();
        for (auto& [id, callback] : callbacks_) {
            callback();
        }
        callbacks_.clear();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load();
    }

    /**
     * @brief Sleep for up to timeout
     * @return true if the token was cancelled before or during the wait
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return cancelled_.load(); });
    }

    /// Runs callback immediately when already cancelled; returns 0 then.
    std::size_t on_cancel(std::function<void()> callback) {
        std::lock_guard lock(mutex_);
        if (cancelled_.load()) {
            callback();
            return 0;
        }
        const auto id = ++next_id_;
        callbacks_.emplace(id, std::move(callback));
        return id;
    }

    void remove_callback(std::size_t id) {
        std::lock_guard lock(mutex_);
        callbacks_.erase(id);
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::map<std::size_t, std::function<void()>> callbacks_;
    std::size_t next_id_ = 0;
};

using CancellationHandle = std::shared_ptr<CancellationToken>;

} // namespace rms
