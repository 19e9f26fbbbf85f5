#pragma once

#include "rms/upload/session_authority.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace rms::upload {

struct ReaperOptions {
    std::chrono::seconds interval{3600};
    std::chrono::seconds session_ttl{24 * 3600};
    std::chrono::seconds terminal_retention{7 * 24 * 3600};
};

struct SweepReport {
    std::size_t expired = 0;
    std::size_t evicted = 0;
};

/**
 * @brief Background sweep that expires stalled sessions
 *
 * Every interval, sessions that are active or paused and have not been
 * updated within session_ttl become expired and lose their chunks.
 * Completed, failed and expired sessions untouched for terminal_retention
 * are then forgotten.
 */
class SessionReaper {
public:
    SessionReaper(SessionAuthority& authority, ReaperOptions options);
    ~SessionReaper();

    SessionReaper(const SessionReaper&) = delete;
    SessionReaper& operator=(const SessionReaper&) = delete;

    void start();
    void stop();

    /// One sweep on the calling thread.
    SweepReport sweep_once();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

private:
    void run();

    SessionAuthority& authority_;
    ReaperOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace rms::upload
