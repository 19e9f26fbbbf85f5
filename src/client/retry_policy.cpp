#include "rms/client/retry_policy.hpp"

#include <algorithm>

namespace rms::client {

RetryPolicy::RetryPolicy(std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay,
                         std::size_t max_attempts)
    : base_delay_(base_delay)
    , max_delay_(max_delay)
    , max_attempts_(std::max<std::size_t>(max_attempts, 1)) {
}

std::chrono::milliseconds RetryPolicy::delay(std::size_t attempt) const {
    auto delay = base_delay_;
    for (std::size_t i = 0; i < attempt; ++i) {
        delay *= 2;
        if (delay >= max_delay_) {
            return max_delay_;
        }
    }
    return std::min(delay, max_delay_);
}

bool RetryPolicy::should_retry(ErrorCode code, std::size_t failures) const {
    return is_retryable(code) && failures < max_attempts_;
}

} // namespace rms::client
