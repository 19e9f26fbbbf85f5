#include "rms/client/session_journal.hpp"

#include "rms/core/base64.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace rms::client {

namespace fs = std::filesystem;
using json = nlohmann::json;

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Uploading: return "uploading";
        case TransferState::Paused: return "paused";
        case TransferState::Failed: return "failed";
        case TransferState::Completed: return "completed";
    }
    return "unknown";
}

std::optional<TransferState> transfer_state_from_string(const std::string& name) {
    for (auto state : {TransferState::Uploading, TransferState::Paused,
                       TransferState::Failed, TransferState::Completed}) {
        if (name == to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

namespace {

bool is_utf8(const std::string& text) {
    try {
        (void)json(text).dump();
    } catch (const json::type_error&) {
        return false;
    }
    return true;
}

json entry_to_json(const JournalEntry& entry) {
    json j{
        {"sessionToken", entry.session_token},
        {"sourcePath", entry.source_path.string()},
        {"filename", entry.filename},
        {"mimeType", entry.mime_type},
        {"fileSize", entry.file_size},
        {"chunkSize", entry.chunk_size},
        {"totalChunks", entry.total_chunks},
        {"uploadedChunks", entry.uploaded_chunks},
        {"state", to_string(entry.state)}
    };
    if (!entry.last_error.empty()) {
        j["lastError"] = entry.last_error;
    }
    // Local paths are raw bytes; keep an exact copy when JSON cannot hold them.
    const auto raw_path = entry.source_path.string();
    if (!is_utf8(raw_path)) {
        j["sourcePathBase64"] = base64_encode(std::vector<std::uint8_t>(raw_path.begin(), raw_path.end()));
    }
    return j;
}

JournalEntry entry_from_json(const json& j) {
    JournalEntry entry;
    entry.session_token = j.at("sessionToken").get<std::string>();
    entry.source_path = j.at("sourcePath").get<std::string>();
    if (auto it = j.find("sourcePathBase64"); it != j.end() && it->is_string()) {
        auto raw = base64_decode(it->get<std::string>());
        if (raw.is_ok()) {
            entry.source_path = std::string(raw.value().begin(), raw.value().end());
        }
    }
    entry.filename = j.value("filename", entry.source_path.filename().string());
    entry.mime_type = j.value("mimeType", std::string("application/octet-stream"));
    entry.file_size = j.at("fileSize").get<std::uint64_t>();
    entry.chunk_size = j.at("chunkSize").get<std::uint64_t>();
    entry.total_chunks = j.value("totalChunks", std::uint32_t{0});
    entry.uploaded_chunks = j.value("uploadedChunks", std::uint32_t{0});
    entry.state = transfer_state_from_string(j.value("state", std::string("uploading")))
                      .value_or(TransferState::Uploading);
    entry.last_error = j.value("lastError", std::string{});
    return entry;
}

} // namespace

SessionJournal::SessionJournal(fs::path path)
    : path_(std::move(path)) {
}

Result<void> SessionJournal::load() {
    std::lock_guard lock(mutex_);
    entries_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Ok();
    }

    std::ifstream input(path_);
    if (!input) {
        return Err<void>(ErrorCode::StorageFailure, "cannot open journal " + path_.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    const json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.contains("sessions") || !doc["sessions"].is_array()) {
        return Err<void>(ErrorCode::InvalidArgument, "journal " + path_.string() + " is malformed");
    }

    for (const auto& item : doc["sessions"]) {
        try {
            entries_.push_back(entry_from_json(item));
        } catch (const json::exception& e) {
            spdlog::warn("[Journal] Skipping malformed entry: {}", e.what());
        }
    }
    spdlog::debug("[Journal] Loaded {} entries from {}", entries_.size(), path_.string());
    return Ok();
}

Result<void> SessionJournal::upsert(const JournalEntry& entry) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const JournalEntry& existing) {
        return existing.session_token == entry.session_token;
    });
    if (it != entries_.end()) {
        *it = entry;
    } else {
        entries_.push_back(entry);
    }
    return save_locked();
}

Result<void> SessionJournal::remove(const std::string& session_token) {
    std::lock_guard lock(mutex_);
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const JournalEntry& entry) {
        return entry.session_token == session_token;
    }), entries_.end());
    if (entries_.size() == before) {
        return Ok();
    }
    return save_locked();
}

std::optional<JournalEntry> SessionJournal::find(const std::string& session_token) const {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.session_token == session_token) {
            return entry;
        }
    }
    return std::nullopt;
}

std::vector<JournalEntry> SessionJournal::entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

Result<void> SessionJournal::save_locked() const {
    json sessions = json::array();
    for (const auto& entry : entries_) {
        sessions.push_back(entry_to_json(entry));
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::StorageFailure, "cannot write " + temp.string());
        }
        output << json{{"sessions", sessions}}.dump(2, ' ', false, json::error_handler_t::replace);
        if (!output) {
            return Err<void>(ErrorCode::StorageFailure, "short write to " + temp.string());
        }
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(ErrorCode::StorageFailure, "cannot replace " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace rms::client
