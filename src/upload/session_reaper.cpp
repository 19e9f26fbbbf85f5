#include "rms/upload/session_reaper.hpp"

#include <spdlog/spdlog.h>

namespace rms::upload {

SessionReaper::SessionReaper(SessionAuthority& authority, ReaperOptions options)
    : authority_(authority), options_(options) {}

SessionReaper::~SessionReaper() {
    stop();
}

void SessionReaper::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread([this] { run(); });
    spdlog::info("[Reaper] Sweeping every {}s, ttl {}s", options_.interval.count(), options_.session_ttl.count());
}

void SessionReaper::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

SweepReport SessionReaper::sweep_once() {
    const auto now = authority_.now();
    const auto expired = authority_.expire_stalled(now - options_.session_ttl);
    if (!expired.empty()) {
        spdlog::info("[Reaper] Expired {} stalled sessions", expired.size());
    }
    const auto evicted = authority_.evict_terminal(now - options_.terminal_retention);
    if (!evicted.empty()) {
        spdlog::info("[Reaper] Forgot {} finished sessions", evicted.size());
    }
    return SweepReport{expired.size(), evicted.size()};
}

void SessionReaper::run() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, options_.interval, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        sweep_once();
        lock.lock();
    }
}

} // namespace rms::upload
