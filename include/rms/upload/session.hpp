#pragma once

#include "rms/core/result.hpp"
#include "rms/upload/types.hpp"

#include <cstdint>
#include <string>

namespace rms::upload {

/**
 * @brief State machine around one UploadSession record
 *
 * Not thread-safe; the SessionAuthority serializes access per session.
 */
class Session {
public:
    explicit Session(UploadSession info);

    [[nodiscard]] const std::string& token() const noexcept { return info_.session_token; }
    [[nodiscard]] const std::string& owner_id() const noexcept { return info_.owner_id; }
    [[nodiscard]] SessionStatus status() const noexcept { return info_.status; }
    [[nodiscard]] const UploadSession& info() const noexcept { return info_; }

    Result<void> transition_to(SessionStatus next, TimePoint now);
    Result<void> mark_failed(std::string reason, TimePoint now);

    /**
     * @brief Record a durably stored chunk
     *
     * Resumes a paused session. Returns false when the index was already
     * recorded.
     */
    bool record_chunk(std::uint32_t index, TimePoint now);

    [[nodiscard]] bool has_chunk(std::uint32_t index) const {
        return info_.uploaded_chunks.count(index) > 0;
    }

    void set_result(std::string file_id, std::string url);
    void set_thumbnail(TimePoint now);

    /// Used on reload when a crash interrupted finalize.
    void restore_status(SessionStatus status);

    [[nodiscard]] bool can_transition(SessionStatus target) const noexcept;

private:
    UploadSession info_;
};

/// Error a mutation on a session in this status fails with.
Error terminal_error(const UploadSession& session);

} // namespace rms::upload
