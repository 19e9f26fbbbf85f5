#pragma once

#include "rms/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace rms::upload {

using TimePoint = std::chrono::system_clock::time_point;
using Clock = std::function<TimePoint()>;

/**
 * @brief Lifecycle of an upload session
 *
 * active <-> paused, {active, paused} -> finalizing -> completed,
 * {active, paused} -> failed (cancel), {active, paused} -> expired (reaper).
 * Completed, Failed and Expired are terminal.
 */
enum class SessionStatus {
    Active,
    Paused,
    Finalizing,
    Completed,
    Failed,
    Expired
};

enum class StorageMode {
    Direct,
    Streamed
};

const char* to_string(SessionStatus status);
std::optional<SessionStatus> session_status_from_string(const std::string& name);

const char* to_string(StorageMode mode);
std::optional<StorageMode> storage_mode_from_string(const std::string& name);

[[nodiscard]] inline bool is_terminal(SessionStatus status) noexcept {
    return status == SessionStatus::Completed ||
           status == SessionStatus::Failed ||
           status == SessionStatus::Expired;
}

/// Chunks may only be accepted in these states.
[[nodiscard]] inline bool accepts_chunks(SessionStatus status) noexcept {
    return status == SessionStatus::Active || status == SessionStatus::Paused;
}

/// ceil(total_size / chunk_size); zero for an empty file or zero chunk size.
std::uint32_t total_chunks(std::uint64_t total_size, std::uint64_t chunk_size);

/**
 * @brief Byte length of chunk `index`
 *
 * Every chunk is chunk_size long except the last, which holds the remainder
 * and is never empty. Out-of-range indices return 0.
 */
std::uint64_t chunk_length(std::uint64_t total_size, std::uint64_t chunk_size, std::uint32_t index);

/**
 * @brief Durable record of one resumable upload
 */
struct UploadSession {
    std::string session_token;
    std::string owner_id;
    std::string filename;
    std::string mime_type;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::set<std::uint32_t> uploaded_chunks;
    SessionStatus status = SessionStatus::Active;
    TimePoint created_at{};
    TimePoint updated_at{};
    std::string result_file_id;   ///< Set once Completed
    std::string result_url;       ///< Set once Completed
    bool has_thumbnail = false;
    std::string last_error;

    [[nodiscard]] bool is_complete() const noexcept {
        return uploaded_chunks.size() == total_chunks;
    }

    [[nodiscard]] std::uint64_t expected_chunk_length(std::uint32_t index) const {
        return chunk_length(total_size, chunk_size, index);
    }

    [[nodiscard]] std::uint64_t uploaded_bytes() const;
};

/**
 * @brief Permanent file reference produced by finalize or a direct upload
 *
 * Streamed files keep their chunks as the storage of record; session_token,
 * chunk_size and total_chunks say where they live. A streamed file may
 * later gain an assembled single-blob copy (assembled_key/assembled_url);
 * the chunks stay in place either way.
 */
struct FinalizedFile {
    std::string id;
    std::string url;
    StorageMode storage_mode = StorageMode::Direct;
    std::string mime_type;
    std::uint64_t file_size = 0;
    std::string filename;
    std::string owner_id;
    std::string storage_key;
    std::string session_token;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::string assembled_key;
    std::string assembled_url;
    TimePoint created_at{};

    [[nodiscard]] bool is_assembled() const noexcept { return !assembled_key.empty(); }
};

void to_json(nlohmann::json& j, const UploadSession& session);
void from_json(const nlohmann::json& j, UploadSession& session);

void to_json(nlohmann::json& j, const FinalizedFile& file);
void from_json(const nlohmann::json& j, FinalizedFile& file);

/// Milliseconds since the epoch, the wire form of every timestamp.
std::int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(std::int64_t ms);

} // namespace rms::upload
