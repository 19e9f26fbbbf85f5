#include "rms/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace rms::upload {
using json = nlohmann::json;

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active: return "active";
        case SessionStatus::Paused: return "paused";
        case SessionStatus::Finalizing: return "finalizing";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Failed: return "failed";
        case SessionStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<SessionStatus> session_status_from_string(const std::string& name) {
    for (auto status : {SessionStatus::Active, SessionStatus::Paused, SessionStatus::Finalizing,
                        SessionStatus::Completed, SessionStatus::Failed, SessionStatus::Expired}) {
        if (name == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* to_string(StorageMode mode) {
    return mode == StorageMode::Streamed ? "streamed" : "direct";
}

std::optional<StorageMode> storage_mode_from_string(const std::string& name) {
    if (name == "direct") {
        return StorageMode::Direct;
    }
    if (name == "streamed") {
        return StorageMode::Streamed;
    }
    return std::nullopt;
}

std::uint32_t total_chunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (total_size == 0 || chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

std::uint64_t chunk_length(std::uint64_t total_size, std::uint64_t chunk_size, std::uint32_t index) {
    const auto count = total_chunks(total_size, chunk_size);
    if (index >= count) {
        return 0;
    }
    if (index + 1 < count) {
        return chunk_size;
    }
    return total_size - static_cast<std::uint64_t>(count - 1) * chunk_size;
}

std::uint64_t UploadSession::uploaded_bytes() const {
    std::uint64_t bytes = 0;
    for (auto index : uploaded_chunks) {
        bytes += expected_chunk_length(index);
    }
    return bytes;
}

std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

void to_json(json& j, const UploadSession& session) {
    j = json{
        {"sessionToken", session.session_token},
        {"ownerId", session.owner_id},
        {"filename", session.filename},
        {"mimeType", session.mime_type},
        {"totalSize", session.total_size},
        {"chunkSize", session.chunk_size},
        {"totalChunks", session.total_chunks},
        {"uploadedChunks", session.uploaded_chunks},
        {"status", to_string(session.status)},
        {"createdAt", to_epoch_ms(session.created_at)},
        {"updatedAt", to_epoch_ms(session.updated_at)},
        {"hasThumbnail", session.has_thumbnail},
    };
    if (!session.result_file_id.empty()) {
        j["resultFileId"] = session.result_file_id;
        j["resultUrl"] = session.result_url;
    }
    if (!session.last_error.empty()) {
        j["lastError"] = session.last_error;
    }
}

void from_json(const json& j, UploadSession& session) {
    j.at("sessionToken").get_to(session.session_token);
    j.at("ownerId").get_to(session.owner_id);
    j.at("filename").get_to(session.filename);
    session.mime_type = j.value("mimeType", std::string("application/octet-stream"));
    j.at("totalSize").get_to(session.total_size);
    j.at("chunkSize").get_to(session.chunk_size);
    session.total_chunks = total_chunks(session.total_size, session.chunk_size);
    session.uploaded_chunks = j.value("uploadedChunks", std::set<std::uint32_t>{});

    const auto status = session_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown session status");
    }
    session.status = *status;
    session.created_at = from_epoch_ms(j.value("createdAt", std::int64_t{0}));
    session.updated_at = from_epoch_ms(j.value("updatedAt", std::int64_t{0}));
    session.result_file_id = j.value("resultFileId", std::string{});
    session.result_url = j.value("resultUrl", std::string{});
    session.has_thumbnail = j.value("hasThumbnail", false);
    session.last_error = j.value("lastError", std::string{});
}

void to_json(json& j, const FinalizedFile& file) {
    j = json{
        {"id", file.id},
        {"url", file.url},
        {"storageMode", to_string(file.storage_mode)},
        {"mimeType", file.mime_type},
        {"fileSize", file.file_size},
        {"filename", file.filename},
        {"ownerId", file.owner_id},
        {"storageKey", file.storage_key},
        {"createdAt", to_epoch_ms(file.created_at)},
    };
    if (file.storage_mode == StorageMode::Streamed) {
        j["sessionToken"] = file.session_token;
        j["chunkSize"] = file.chunk_size;
        j["totalChunks"] = file.total_chunks;
        if (file.is_assembled()) {
            j["assembledKey"] = file.assembled_key;
            j["assembledUrl"] = file.assembled_url;
        }
    }
}

void from_json(const json& j, FinalizedFile& file) {
    j.at("id").get_to(file.id);
    j.at("url").get_to(file.url);
    const auto mode = storage_mode_from_string(j.at("storageMode").get<std::string>());
    if (!mode) {
        throw std::invalid_argument("unknown storage mode");
    }
    file.storage_mode = *mode;
    file.mime_type = j.value("mimeType", std::string("application/octet-stream"));
    j.at("fileSize").get_to(file.file_size);
    file.filename = j.value("filename", std::string{});
    file.owner_id = j.value("ownerId", std::string{});
    file.storage_key = j.value("storageKey", std::string{});
    file.session_token = j.value("sessionToken", std::string{});
    file.chunk_size = j.value("chunkSize", std::uint64_t{0});
    file.total_chunks = j.value("totalChunks", std::uint32_t{0});
    file.assembled_key = j.value("assembledKey", std::string{});
    file.assembled_url = j.value("assembledUrl", std::string{});
    file.created_at = from_epoch_ms(j.value("createdAt", std::int64_t{0}));
}

} // namespace rms::upload
