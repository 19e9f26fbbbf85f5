#pragma once

#include "rms/storage/blob_store.hpp"
#include "rms/upload/types.hpp"

#include <string>
#include <vector>

namespace rms::upload {

/**
 * @brief Persists UploadSession records as JSON documents
 *
 * One document per session at "sessions/<token>.json" in a metadata blob
 * store. Each save replaces the document atomically.
 */
class SessionRepository {
public:
    explicit SessionRepository(storage::BlobStore& store);

    Result<void> save(const UploadSession& session);
    Result<void> remove(const std::string& session_token);

    /// Every readable document; unreadable ones are logged and skipped.
    Result<std::vector<UploadSession>> load_all() const;

    static std::string key_for(const std::string& session_token);

private:
    storage::BlobStore& store_;
};

} // namespace rms::upload
