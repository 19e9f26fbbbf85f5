#pragma once

#include "rms/core/cancellation.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rms::client {

/**
 * @brief Cancellation handles of running transfers, keyed by session token
 *
 * Lets any caller cancel a transfer it did not start, without holding a
 * reference to the code running it.
 */
class TransferRegistry {
public:
    /// Handle for token, creating it on first use.
    CancellationHandle acquire(const std::string& session_token);

    CancellationHandle find(const std::string& session_token) const;

    /// Drop the handle and trip it. Returns false when no transfer was registered.
    bool cancel(const std::string& session_token);

    /// Drop the handle without tripping it (transfer ended on its own).
    void release(const std::string& session_token);

    std::vector<std::string> tokens() const;

    std::size_t cancel_all();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CancellationHandle> handles_;
};

} // namespace rms::client
