#pragma once

#include "rms/events/event_bus.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/upload/file_catalog.hpp"
#include "rms/upload/finalizer.hpp"
#include "rms/upload/session.hpp"
#include "rms/upload/session_repository.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rms::upload {

struct AuthorityOptions {
    std::uint64_t default_chunk_size = 5ULL * 1024 * 1024;
    std::uint64_t min_chunk_size = 64ULL * 1024;
    std::uint64_t max_chunk_size = 64ULL * 1024 * 1024;
};

struct CreateSessionRequest {
    std::string owner_id;
    std::string filename;
    std::string mime_type;
    std::int64_t total_size = 0;
    std::uint64_t chunk_size = 0;   ///< 0 = server default
};

struct SessionHandle {
    std::string session_token;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

struct ChunkReceipt {
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t uploaded_bytes = 0;
    bool duplicate = false;
};

/**
 * @brief Single source of truth for upload sessions
 *
 * Owns every UploadSession and its chunk-presence set, validates chunk
 * uploads, and drives finalize, cancel and expiry.
 *
 * THREAD SAFETY:
 * - Different sessions never contend beyond the session map lookup
 * - Different indices of one session are stored concurrently
 * - The same (session, index) is serialized by a striped lock, so a retry
 *   racing its original either waits and becomes a no-op or overwrites
 *   atomically
 * - finalize() is single-flight per session; late callers observe the
 *   result of the first
 *
 * Every mutation is scoped to the owner. A session owned by someone else
 * reports SessionNotFound.
 */
class SessionAuthority {
public:
    SessionAuthority(storage::ChunkStore& chunks,
                     Finalizer& finalizer,
                     FileCatalog& catalog,
                     events::EventBus& bus,
                     AuthorityOptions options = {},
                     SessionRepository* repository = nullptr,
                     Clock clock = {});

    /**
     * @brief Reload persisted sessions
     *
     * Sessions caught mid-finalize become active. Open sessions forget any
     * chunk the store no longer holds, so the client uploads it again.
     */
    Result<std::size_t> load();

    Result<SessionHandle> create_session(const CreateSessionRequest& request);

    Result<ChunkReceipt> accept_chunk(const std::string& owner_id,
                                      const std::string& session_token,
                                      std::uint32_t index,
                                      const std::vector<std::uint8_t>& bytes);

    /// Advisory; the next accepted chunk resumes the session.
    Result<void> pause(const std::string& owner_id, const std::string& session_token);

    /// Idempotent. Deletes the session's chunks and marks it failed.
    Result<void> cancel(const std::string& owner_id, const std::string& session_token);

    Result<FinalizedFile> finalize(const std::string& owner_id, const std::string& session_token);

    Result<void> save_thumbnail(const std::string& owner_id,
                                const std::string& session_token,
                                const std::vector<std::uint8_t>& image);

    Result<UploadSession> status(const std::string& owner_id, const std::string& session_token) const;

    /// Owner's active and paused sessions, oldest first.
    std::vector<UploadSession> list_active(const std::string& owner_id) const;

    /// Unscoped lookup for the streaming endpoint, which is addressed by token.
    std::optional<UploadSession> snapshot(const std::string& session_token) const;

    /**
     * @brief Expire active/paused sessions not updated since cutoff
     *
     * The only path that produces Expired. Returns the expired tokens.
     */
    std::vector<std::string> expire_stalled(TimePoint cutoff);

    /**
     * @brief Forget terminal sessions last updated before cutoff
     *
     * Drops them from memory and from the repository. Stored data is not
     * touched: finalized files stay reachable through the catalog.
     */
    std::vector<std::string> evict_terminal(TimePoint cutoff);

    /// Owner's finalized files, oldest first.
    std::vector<FinalizedFile> list_files(const std::string& owner_id) const;

    /// Remove a finalized file of this owner together with its stored data.
    Result<void> delete_file(const std::string& owner_id, const std::string& file_id);

    [[nodiscard]] std::size_t session_count() const;
    [[nodiscard]] TimePoint now() const { return clock_(); }

    static std::string thumbnail_key(const std::string& session_token);

private:
    static constexpr std::size_t kIndexStripes = 32;

    struct Entry {
        explicit Entry(UploadSession info) : session(std::move(info)) {}

        std::mutex mutex;                 ///< Guards session
        std::mutex finalize_mutex;        ///< Single-flight finalize, also taken by cancel
        std::array<std::mutex, kIndexStripes> index_locks;
        Session session;
    };

    Result<std::shared_ptr<Entry>> find_entry(const std::string& session_token) const;
    Result<std::shared_ptr<Entry>> find_owned(const std::string& owner_id, const std::string& session_token) const;

    /// Caller holds entry.mutex. Logs and keeps going on failure.
    void persist_locked(const Entry& entry) const;

    Result<FinalizedFile> completed_result(const UploadSession& session) const;

    storage::ChunkStore& chunks_;
    Finalizer& finalizer_;
    FileCatalog& catalog_;
    events::EventBus& event_bus_;
    AuthorityOptions options_;
    SessionRepository* repository_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace rms::upload
