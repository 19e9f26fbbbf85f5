#pragma once

#include "rms/core/error.hpp"

#include <chrono>
#include <cstddef>

namespace rms::client {

/**
 * @brief Exponential backoff for chunk uploads
 *
 * delay(attempt) = base_delay * 2^attempt, capped at max_delay. With the
 * default 1500 ms base the first three retries wait 3 s, 6 s and 12 s.
 * An operation is tried at most max_attempts times in total.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(std::chrono::milliseconds base_delay,
                std::chrono::milliseconds max_delay,
                std::size_t max_attempts);

    /// Wait before retry number `attempt` (1 = first retry).
    [[nodiscard]] std::chrono::milliseconds delay(std::size_t attempt) const;

    /// Whether another try is allowed after `failures` failed tries ending in `code`.
    [[nodiscard]] bool should_retry(ErrorCode code, std::size_t failures) const;

    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }

private:
    std::chrono::milliseconds base_delay_{1500};
    std::chrono::milliseconds max_delay_{60000};
    std::size_t max_attempts_ = 5;
};

} // namespace rms::client
