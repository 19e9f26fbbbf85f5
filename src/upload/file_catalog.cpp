#include "rms/upload/file_catalog.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace rms::upload {
using json = nlohmann::json;

FileCatalog::FileCatalog(storage::BlobStore& store) : store_(&store) {}

Result<void> FileCatalog::load() {
    if (store_ == nullptr || !store_->exists(kCatalogKey)) {
        return Ok();
    }
    auto bytes = store_->get(kCatalogKey);
    if (bytes.is_error()) {
        return forward_error<void>(bytes);
    }
    auto doc = json::parse(bytes.value().begin(), bytes.value().end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("files") || !doc["files"].is_array()) {
        return Err<void>(ErrorCode::StorageFailure, "Catalog is not valid JSON");
    }

    std::unique_lock lock(mutex_);
    files_.clear();
    by_session_.clear();
    for (const auto& entry : doc["files"]) {
        try {
            auto file = entry.get<FinalizedFile>();
            if (file.storage_mode == StorageMode::Streamed &&
                (file.session_token.empty() || file.chunk_size == 0)) {
                spdlog::warn("[FileCatalog] Skipping streamed file {} without chunk layout", file.id);
                continue;
            }
            if (!file.session_token.empty()) {
                by_session_[file.session_token] = file.id;
            }
            files_[file.id] = std::move(file);
        } catch (const std::exception& e) {
            spdlog::warn("[FileCatalog] Skipping malformed entry: {}", e.what());
        }
    }
    spdlog::info("[FileCatalog] Loaded {} files", files_.size());
    return Ok();
}

Result<void> FileCatalog::add(const FinalizedFile& file) {
    std::unique_lock lock(mutex_);
    files_[file.id] = file;
    if (!file.session_token.empty()) {
        by_session_[file.session_token] = file.id;
    }
    return persist_locked();
}

Result<void> FileCatalog::remove(const std::string& file_id) {
    std::unique_lock lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return Ok();
    }
    by_session_.erase(it->second.session_token);
    files_.erase(it);
    return persist_locked();
}

Result<void> FileCatalog::mark_assembled(const std::string& file_id,
                                         const std::string& key,
                                         const std::string& url) {
    std::unique_lock lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return Err<void>(ErrorCode::SessionNotFound, "Unknown file: " + file_id);
    }
    it->second.assembled_key = key;
    it->second.assembled_url = url;
    return persist_locked();
}

std::optional<FinalizedFile> FileCatalog::find(const std::string& file_id) const {
    std::shared_lock lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<FinalizedFile> FileCatalog::find_by_session(const std::string& session_token) const {
    std::shared_lock lock(mutex_);
    auto it = by_session_.find(session_token);
    if (it == by_session_.end()) {
        return std::nullopt;
    }
    auto file = files_.find(it->second);
    if (file == files_.end()) {
        return std::nullopt;
    }
    return file->second;
}

std::vector<FinalizedFile> FileCatalog::list_for_owner(const std::string& owner_id) const {
    std::shared_lock lock(mutex_);
    std::vector<FinalizedFile> result;
    for (const auto& [id, file] : files_) {
        if (file.owner_id == owner_id) {
            result.push_back(file);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const FinalizedFile& a, const FinalizedFile& b) { return a.created_at < b.created_at; });
    return result;
}

std::vector<FinalizedFile> FileCatalog::pending_assembly() const {
    std::shared_lock lock(mutex_);
    std::vector<FinalizedFile> result;
    for (const auto& [id, file] : files_) {
        if (file.storage_mode == StorageMode::Streamed && !file.is_assembled()) {
            result.push_back(file);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const FinalizedFile& a, const FinalizedFile& b) { return a.created_at < b.created_at; });
    return result;
}

std::size_t FileCatalog::size() const {
    std::shared_lock lock(mutex_);
    return files_.size();
}

Result<void> FileCatalog::persist_locked() const {
    if (store_ == nullptr) {
        return Ok();
    }
    json files = json::array();
    for (const auto& [id, file] : files_) {
        files.push_back(file);
    }
    const auto text = json{{"files", files}}.dump(2, ' ', false, json::error_handler_t::replace);
    return store_->put(kCatalogKey, std::vector<std::uint8_t>(text.begin(), text.end()));
}

} // namespace rms::upload
