#include "rms/client/transfer_registry.hpp"

namespace rms::client {

CancellationHandle TransferRegistry::acquire(const std::string& session_token) {
    std::lock_guard lock(mutex_);
    auto& handle = handles_[session_token];
    if (!handle || handle->is_cancelled()) {
        handle = std::make_shared<CancellationToken>();
    }
    return handle;
}

CancellationHandle TransferRegistry::find(const std::string& session_token) const {
    std::lock_guard lock(mutex_);
    auto it = handles_.find(session_token);
    return it != handles_.end() ? it->second : nullptr;
}

bool TransferRegistry::cancel(const std::string& session_token) {
    CancellationHandle handle;
    {
        std::lock_guard lock(mutex_);
        auto it = handles_.find(session_token);
        if (it == handles_.end()) {
            return false;
        }
        handle = std::move(it->second);
        handles_.erase(it);
    }
    // Tripped outside the lock: callbacks may block on network teardown
    handle->cancel();
    return true;
}

void TransferRegistry::release(const std::string& session_token) {
    std::lock_guard lock(mutex_);
    handles_.erase(session_token);
}

std::vector<std::string> TransferRegistry::tokens() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(handles_.size());
    for (const auto& [token, handle] : handles_) {
        result.push_back(token);
    }
    return result;
}

std::size_t TransferRegistry::cancel_all() {
    std::size_t count = 0;
    for (const auto& token : tokens()) {
        if (cancel(token)) {
            ++count;
        }
    }
    return count;
}

std::size_t TransferRegistry::size() const {
    std::lock_guard lock(mutex_);
    return handles_.size();
}

} // namespace rms::client
