#pragma once

#include "rms/storage/blob_store.hpp"
#include "rms/upload/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rms::upload {

/**
 * @brief Registry of finalized files
 *
 * The minimal file record the rest of the application consumes. The whole
 * catalog is rewritten to "catalog.json" after each change when a store is
 * attached; without one it lives in memory only.
 */
class FileCatalog {
public:
    FileCatalog() = default;
    explicit FileCatalog(storage::BlobStore& store);

    Result<void> load();

    Result<void> add(const FinalizedFile& file);
    Result<void> remove(const std::string& file_id);

    /// Record the single-blob copy of a streamed file. SessionNotFound if the file is gone.
    Result<void> mark_assembled(const std::string& file_id, const std::string& key, const std::string& url);

    std::optional<FinalizedFile> find(const std::string& file_id) const;
    std::optional<FinalizedFile> find_by_session(const std::string& session_token) const;
    std::vector<FinalizedFile> list_for_owner(const std::string& owner_id) const;

    /// Streamed files without an assembled copy, oldest first.
    std::vector<FinalizedFile> pending_assembly() const;

    [[nodiscard]] std::size_t size() const;

    static constexpr const char* kCatalogKey = "catalog.json";

private:
    Result<void> persist_locked() const;

    storage::BlobStore* store_ = nullptr;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FinalizedFile> files_;
    std::unordered_map<std::string, std::string> by_session_;
};

} // namespace rms::upload
