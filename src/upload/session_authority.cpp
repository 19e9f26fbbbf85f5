#include "rms/upload/session_authority.hpp"

#include "rms/core/ids.hpp"
#include "rms/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace rms::upload {

namespace {

ChunkReceipt make_receipt(const UploadSession& info, bool duplicate) {
    ChunkReceipt receipt;
    receipt.uploaded_chunks = static_cast<std::uint32_t>(info.uploaded_chunks.size());
    receipt.total_chunks = info.total_chunks;
    receipt.uploaded_bytes = info.uploaded_bytes();
    receipt.duplicate = duplicate;
    return receipt;
}

events::ChunkAcceptedEvent make_chunk_event(const UploadSession& info, std::uint32_t index,
                                            std::uint64_t bytes, bool duplicate) {
    events::ChunkAcceptedEvent event;
    event.session_token = info.session_token;
    event.chunk_index = index;
    event.uploaded_chunks = static_cast<std::uint32_t>(info.uploaded_chunks.size());
    event.total_chunks = info.total_chunks;
    event.bytes = bytes;
    event.duplicate = duplicate;
    return event;
}

} // namespace

SessionAuthority::SessionAuthority(storage::ChunkStore& chunks,
                                   Finalizer& finalizer,
                                   FileCatalog& catalog,
                                   events::EventBus& bus,
                                   AuthorityOptions options,
                                   SessionRepository* repository,
                                   Clock clock)
    : chunks_(chunks),
      finalizer_(finalizer),
      catalog_(catalog),
      event_bus_(bus),
      options_(options),
      repository_(repository),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

std::string SessionAuthority::thumbnail_key(const std::string& session_token) {
    return "thumbnails/" + session_token;
}

Result<std::size_t> SessionAuthority::load() {
    if (repository_ == nullptr) {
        return Ok(std::size_t{0});
    }
    auto loaded = repository_->load_all();
    if (loaded.is_error()) {
        return forward_error<std::size_t>(loaded);
    }

    std::unique_lock lock(mutex_);
    for (auto& info : loaded.value()) {
        info.total_chunks = total_chunks(info.total_size, info.chunk_size);
        for (auto it = info.uploaded_chunks.begin(); it != info.uploaded_chunks.end();) {
            it = *it >= info.total_chunks ? info.uploaded_chunks.erase(it) : std::next(it);
        }

        bool changed = false;
        if (!is_terminal(info.status)) {
            // The document may claim chunks the store lost; those must be uploaded again.
            const auto claimed = info.uploaded_chunks.size();
            for (auto it = info.uploaded_chunks.begin(); it != info.uploaded_chunks.end();) {
                it = chunks_.has(info.session_token, *it) ? std::next(it) : info.uploaded_chunks.erase(it);
            }
            if (info.uploaded_chunks.size() != claimed) {
                spdlog::warn("[SessionAuthority] {} lost {} chunks from storage, they will be re-requested",
                             info.session_token, claimed - info.uploaded_chunks.size());
                changed = true;
            }
        }
        if (info.status == SessionStatus::Finalizing) {
            spdlog::warn("[SessionAuthority] {} was interrupted while finalizing, restoring to active",
                         info.session_token);
            info.status = SessionStatus::Active;
            changed = true;
        }
        if (info.status == SessionStatus::Completed) {
            // Leftovers of a crash between the completed write and chunk cleanup.
            if (auto res = finalizer_.release_chunks(info); res.is_error()) {
                spdlog::warn("[SessionAuthority] Cannot release chunks of {}: {}",
                             info.session_token, res.error().message);
            }
        }

        auto entry = std::make_shared<Entry>(info);
        if (changed) {
            std::lock_guard entry_lock(entry->mutex);
            persist_locked(*entry);
        }
        sessions_[info.session_token] = std::move(entry);
    }
    spdlog::info("[SessionAuthority] Loaded {} sessions", sessions_.size());
    return Ok(sessions_.size());
}

Result<SessionHandle> SessionAuthority::create_session(const CreateSessionRequest& request) {
    if (request.total_size <= 0) {
        return Err<SessionHandle>(ErrorCode::InvalidSize, "totalSize must be greater than zero");
    }
    if (request.owner_id.empty()) {
        return Err<SessionHandle>(ErrorCode::InvalidArgument, "ownerId is required");
    }
    if (request.filename.empty()) {
        return Err<SessionHandle>(ErrorCode::InvalidArgument, "filename is required");
    }

    const auto chunk_size = request.chunk_size == 0 ? options_.default_chunk_size : request.chunk_size;
    if (chunk_size < options_.min_chunk_size || chunk_size > options_.max_chunk_size) {
        return Err<SessionHandle>(ErrorCode::InvalidArgument,
                                  "chunkSize must be between " + std::to_string(options_.min_chunk_size) +
                                  " and " + std::to_string(options_.max_chunk_size));
    }

    const auto total_size = static_cast<std::uint64_t>(request.total_size);
    if ((total_size - 1) / chunk_size >= std::numeric_limits<std::uint32_t>::max()) {
        return Err<SessionHandle>(ErrorCode::InvalidSize, "totalSize needs too many chunks");
    }

    UploadSession info;
    info.owner_id = request.owner_id;
    info.filename = request.filename;
    info.mime_type = request.mime_type.empty() ? "application/octet-stream" : request.mime_type;
    info.total_size = total_size;
    info.chunk_size = chunk_size;
    info.total_chunks = total_chunks(total_size, chunk_size);
    info.status = SessionStatus::Active;
    info.created_at = clock_();
    info.updated_at = info.created_at;

    {
        std::unique_lock lock(mutex_);
        do {
            info.session_token = generate_token();
        } while (sessions_.count(info.session_token) > 0);

        auto entry = std::make_shared<Entry>(info);
        {
            std::lock_guard entry_lock(entry->mutex);
            persist_locked(*entry);
        }
        sessions_.emplace(info.session_token, std::move(entry));
    }

    events::SessionCreatedEvent event;
    event.session_token = info.session_token;
    event.owner_id = info.owner_id;
    event.filename = info.filename;
    event.total_size = info.total_size;
    event.chunk_size = info.chunk_size;
    event.total_chunks = info.total_chunks;
    event_bus_.emit(event);

    return Ok(SessionHandle{info.session_token, info.chunk_size, info.total_chunks});
}

Result<ChunkReceipt> SessionAuthority::accept_chunk(const std::string& owner_id,
                                                    const std::string& session_token,
                                                    std::uint32_t index,
                                                    const std::vector<std::uint8_t>& bytes) {
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<ChunkReceipt>(found);
    }
    auto entry = found.value();

    std::lock_guard index_lock(entry->index_locks[index % kIndexStripes]);

    {
        std::lock_guard lock(entry->mutex);
        const auto& info = entry->session.info();
        const bool same_size = bytes.size() == info.expected_chunk_length(index);

        if (!accepts_chunks(info.status)) {
            const bool retained = info.status == SessionStatus::Finalizing ||
                                  info.status == SessionStatus::Completed;
            if (retained && entry->session.has_chunk(index) && same_size) {
                auto receipt = make_receipt(info, true);
                auto event = make_chunk_event(info, index, bytes.size(), true);
                event_bus_.emit(event);
                return Ok(receipt);
            }
            return Err<ChunkReceipt, Error>(terminal_error(info));
        }
        if (index >= info.total_chunks) {
            return Err<ChunkReceipt>(ErrorCode::IndexOutOfRange,
                                     "Chunk index " + std::to_string(index) + " outside [0, " +
                                     std::to_string(info.total_chunks) + ")");
        }
        if (entry->session.has_chunk(index)) {
            if (!same_size) {
                return Err<ChunkReceipt>(ErrorCode::Conflict,
                                         "Chunk " + std::to_string(index) + " already stored with a different size");
            }
            auto receipt = make_receipt(info, true);
            event_bus_.emit(make_chunk_event(info, index, bytes.size(), true));
            return Ok(receipt);
        }
        if (!same_size) {
            return Err<ChunkReceipt>(ErrorCode::InvalidSize,
                                     "Chunk " + std::to_string(index) + " must be " +
                                     std::to_string(info.expected_chunk_length(index)) + " bytes, got " +
                                     std::to_string(bytes.size()));
        }
    }

    // Stored outside the session lock so other indices proceed concurrently.
    if (auto stored = chunks_.put(session_token, index, bytes); stored.is_error()) {
        return forward_error<ChunkReceipt>(stored);
    }

    ChunkReceipt receipt;
    events::ChunkAcceptedEvent event;
    {
        std::lock_guard lock(entry->mutex);
        if (!accepts_chunks(entry->session.status())) {
            // Cancelled or expired while the chunk was in flight.
            if (auto res = chunks_.blobs().remove(storage::chunk_key(session_token, index)); res.is_error()) {
                spdlog::error("[SessionAuthority] Failed to drop late chunk {}#{}: {}",
                              session_token, index, res.error().message);
            }
            return Err<ChunkReceipt, Error>(terminal_error(entry->session.info()));
        }
        entry->session.record_chunk(index, clock_());
        persist_locked(*entry);
        receipt = make_receipt(entry->session.info(), false);
        event = make_chunk_event(entry->session.info(), index, bytes.size(), false);
    }

    event_bus_.emit(event);
    return Ok(receipt);
}

Result<void> SessionAuthority::pause(const std::string& owner_id, const std::string& session_token) {
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<void>(found);
    }
    auto entry = found.value();

    {
        std::lock_guard lock(entry->mutex);
        const auto status = entry->session.status();
        if (is_terminal(status)) {
            return Err<void, Error>(terminal_error(entry->session.info()));
        }
        if (status != SessionStatus::Active) {
            return Ok();
        }
        if (auto res = entry->session.transition_to(SessionStatus::Paused, clock_()); res.is_error()) {
            return res;
        }
        persist_locked(*entry);
    }

    event_bus_.emit(events::SessionPausedEvent{session_token});
    return Ok();
}

Result<void> SessionAuthority::cancel(const std::string& owner_id, const std::string& session_token) {
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<void>(found);
    }
    auto entry = found.value();

    // Waits for an in-flight finalize so chunks are never pulled from under it.
    std::lock_guard flight(entry->finalize_mutex);

    bool newly_cancelled = false;
    {
        std::lock_guard lock(entry->mutex);
        const auto status = entry->session.status();
        if (status == SessionStatus::Completed) {
            return Ok();
        }
        if (!is_terminal(status)) {
            if (auto res = entry->session.mark_failed("cancelled", clock_()); res.is_error()) {
                return res;
            }
            persist_locked(*entry);
            newly_cancelled = true;
        }
    }

    // Repeated cancels retry the cleanup of an earlier attempt.
    auto removed = chunks_.delete_all(session_token);
    if (removed.is_error()) {
        return forward_error<void>(removed);
    }
    if (auto res = chunks_.blobs().remove(thumbnail_key(session_token)); res.is_error()) {
        spdlog::warn("[SessionAuthority] Failed to drop thumbnail of {}: {}", session_token, res.error().message);
    }

    if (newly_cancelled) {
        event_bus_.emit(events::SessionCancelledEvent{session_token, removed.value()});
    }
    return Ok();
}

Result<FinalizedFile> SessionAuthority::finalize(const std::string& owner_id, const std::string& session_token) {
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<FinalizedFile>(found);
    }
    auto entry = found.value();

    std::lock_guard flight(entry->finalize_mutex);

    UploadSession snapshot;
    SessionStatus previous = SessionStatus::Active;
    {
        std::lock_guard lock(entry->mutex);
        const auto& info = entry->session.info();
        if (info.status == SessionStatus::Completed) {
            return completed_result(info);
        }
        if (is_terminal(info.status)) {
            return Err<FinalizedFile, Error>(terminal_error(info));
        }
        if (!info.is_complete()) {
            return Err<FinalizedFile>(ErrorCode::IncompleteUpload,
                                      "Upload incomplete: " + std::to_string(info.uploaded_chunks.size()) +
                                      "/" + std::to_string(info.total_chunks) + " chunks received");
        }
        previous = info.status;
        if (auto res = entry->session.transition_to(SessionStatus::Finalizing, clock_()); res.is_error()) {
            return forward_error<FinalizedFile>(res);
        }
        persist_locked(*entry);
        snapshot = entry->session.info();
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = finalizer_.finalize(snapshot, clock_());

    if (result.is_error()) {
        {
            std::lock_guard lock(entry->mutex);
            entry->session.restore_status(previous);
            persist_locked(*entry);
        }
        event_bus_.emit(events::FinalizeFailedEvent{session_token, result.error().message});
        return result;
    }

    const auto& file = result.value();
    if (auto res = catalog_.add(file); res.is_error()) {
        spdlog::error("[SessionAuthority] Catalog write for {} failed: {}", file.id, res.error().message);
    }

    {
        std::lock_guard lock(entry->mutex);
        entry->session.set_result(file.id, file.url);
        if (auto res = entry->session.transition_to(SessionStatus::Completed, clock_()); res.is_error()) {
            return forward_error<FinalizedFile>(res);
        }
        persist_locked(*entry);
    }

    // Only now that completed is durable may direct-mode chunks go.
    if (auto released = finalizer_.release_chunks(snapshot); released.is_error()) {
        spdlog::warn("[SessionAuthority] {} completed but chunk cleanup failed: {}",
                     session_token, released.error().message);
    }

    events::UploadFinalizedEvent event;
    event.session_token = session_token;
    event.file_id = file.id;
    event.storage_mode = to_string(file.storage_mode);
    event.total_size = file.file_size;
    event.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event_bus_.emit(event);

    return result;
}

Result<void> SessionAuthority::save_thumbnail(const std::string& owner_id,
                                              const std::string& session_token,
                                              const std::vector<std::uint8_t>& image) {
    if (image.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "thumbnailData is empty");
    }
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<void>(found);
    }
    auto entry = found.value();

    {
        std::lock_guard lock(entry->mutex);
        const auto status = entry->session.status();
        if (status == SessionStatus::Failed || status == SessionStatus::Expired) {
            return Err<void, Error>(terminal_error(entry->session.info()));
        }
    }

    if (auto res = chunks_.blobs().put(thumbnail_key(session_token), image); res.is_error()) {
        return res;
    }

    std::lock_guard lock(entry->mutex);
    entry->session.set_thumbnail(clock_());
    persist_locked(*entry);
    return Ok();
}

Result<UploadSession> SessionAuthority::status(const std::string& owner_id, const std::string& session_token) const {
    auto found = find_owned(owner_id, session_token);
    if (found.is_error()) {
        return forward_error<UploadSession>(found);
    }
    std::lock_guard lock(found.value()->mutex);
    return Ok(found.value()->session.info());
}

std::vector<UploadSession> SessionAuthority::list_active(const std::string& owner_id) const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [token, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<UploadSession> result;
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        const auto& info = entry->session.info();
        if (info.owner_id == owner_id && accepts_chunks(info.status)) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const UploadSession& a, const UploadSession& b) { return a.created_at < b.created_at; });
    return result;
}

std::optional<UploadSession> SessionAuthority::snapshot(const std::string& session_token) const {
    auto found = find_entry(session_token);
    if (found.is_error()) {
        return std::nullopt;
    }
    std::lock_guard lock(found.value()->mutex);
    return found.value()->session.info();
}

std::vector<std::string> SessionAuthority::expire_stalled(TimePoint cutoff) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [token, entry] : sessions_) {
            entries.push_back(entry);
        }
    }

    std::vector<std::string> expired;
    for (const auto& entry : entries) {
        std::string token;
        std::chrono::seconds idle{0};
        {
            std::lock_guard lock(entry->mutex);
            const auto& info = entry->session.info();
            if (!accepts_chunks(info.status) || info.updated_at >= cutoff) {
                continue;
            }
            const auto now = clock_();
            idle = std::chrono::duration_cast<std::chrono::seconds>(now - info.updated_at);
            if (auto res = entry->session.transition_to(SessionStatus::Expired, now); res.is_error()) {
                spdlog::error("[SessionAuthority] Cannot expire {}: {}", info.session_token, res.error().message);
                continue;
            }
            persist_locked(*entry);
            token = info.session_token;
        }

        std::size_t chunks_removed = 0;
        auto removed = chunks_.delete_all(token);
        if (removed.is_error()) {
            spdlog::error("[SessionAuthority] Expired {} but chunk removal failed: {}", token, removed.error().message);
        } else {
            chunks_removed = removed.value();
        }
        if (auto res = chunks_.blobs().remove(thumbnail_key(token)); res.is_error()) {
            spdlog::warn("[SessionAuthority] Failed to drop thumbnail of {}: {}", token, res.error().message);
        }

        event_bus_.emit(events::SessionExpiredEvent{token, chunks_removed, idle});
        expired.push_back(std::move(token));
    }
    return expired;
}

std::vector<std::string> SessionAuthority::evict_terminal(TimePoint cutoff) {
    std::vector<std::string> evicted;
    {
        std::unique_lock lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            bool stale = false;
            {
                std::lock_guard entry_lock(it->second->mutex);
                const auto& info = it->second->session.info();
                stale = is_terminal(info.status) && info.updated_at < cutoff;
            }
            if (stale) {
                evicted.push_back(it->first);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (repository_ != nullptr) {
        for (const auto& token : evicted) {
            if (auto res = repository_->remove(token); res.is_error()) {
                spdlog::error("[SessionAuthority] Failed to drop record of {}: {}", token, res.error().message);
            }
        }
    }
    return evicted;
}

std::vector<FinalizedFile> SessionAuthority::list_files(const std::string& owner_id) const {
    return catalog_.list_for_owner(owner_id);
}

Result<void> SessionAuthority::delete_file(const std::string& owner_id, const std::string& file_id) {
    auto file = catalog_.find(file_id);
    if (!file || file->owner_id != owner_id) {
        return Err<void>(ErrorCode::SessionNotFound, "Unknown file: " + file_id);
    }

    // The reference goes first, so nothing resolves the file while its data is removed.
    if (auto res = catalog_.remove(file_id); res.is_error()) {
        return res;
    }

    std::size_t blobs_removed = 0;
    auto drop_blob = [this, &blobs_removed, &file_id](const std::string& key) {
        if (auto res = chunks_.blobs().remove(key); res.is_error()) {
            spdlog::error("[SessionAuthority] File {} deleted but {} remains: {}", file_id, key, res.error().message);
        } else {
            ++blobs_removed;
        }
    };

    if (file->storage_mode == StorageMode::Direct) {
        drop_blob(file->storage_key);
    } else {
        auto removed = chunks_.delete_all(file->session_token);
        if (removed.is_error()) {
            spdlog::error("[SessionAuthority] File {} deleted but its chunks remain: {}",
                          file_id, removed.error().message);
        } else {
            blobs_removed += removed.value();
        }
        if (file->is_assembled()) {
            drop_blob(file->assembled_key);
        }
        drop_blob(thumbnail_key(file->session_token));

        {
            std::unique_lock lock(mutex_);
            sessions_.erase(file->session_token);
        }
        if (repository_ != nullptr) {
            if (auto res = repository_->remove(file->session_token); res.is_error()) {
                spdlog::error("[SessionAuthority] Failed to drop record of {}: {}",
                              file->session_token, res.error().message);
            }
        }
    }

    event_bus_.emit(events::FileDeletedEvent{file_id, owner_id, blobs_removed});
    return Ok();
}

std::size_t SessionAuthority::session_count() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

Result<std::shared_ptr<SessionAuthority::Entry>> SessionAuthority::find_entry(const std::string& session_token) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_token);
    if (it == sessions_.end()) {
        return Err<std::shared_ptr<Entry>>(ErrorCode::SessionNotFound, "Unknown session: " + session_token);
    }
    return Ok(it->second);
}

Result<std::shared_ptr<SessionAuthority::Entry>> SessionAuthority::find_owned(const std::string& owner_id,
                                                                            const std::string& session_token) const {
    auto found = find_entry(session_token);
    if (found.is_error()) {
        return found;
    }
    // Owner is immutable after creation, no entry lock needed.
    if (found.value()->session.owner_id() != owner_id) {
        return Err<std::shared_ptr<Entry>>(ErrorCode::SessionNotFound, "Unknown session: " + session_token);
    }
    return found;
}

void SessionAuthority::persist_locked(const Entry& entry) const {
    if (repository_ == nullptr) {
        return;
    }
    if (auto res = repository_->save(entry.session.info()); res.is_error()) {
        spdlog::error("[SessionAuthority] Failed to persist {}: {}", entry.session.token(), res.error().message);
    }
}

Result<FinalizedFile> SessionAuthority::completed_result(const UploadSession& session) const {
    if (auto file = catalog_.find(session.result_file_id)) {
        return Ok(*file);
    }
    FinalizedFile file;
    file.id = session.result_file_id;
    file.url = session.result_url;
    file.storage_mode = finalizer_.choose_mode(session.total_size);
    file.mime_type = session.mime_type;
    file.file_size = session.total_size;
    file.filename = session.filename;
    file.owner_id = session.owner_id;
    return Ok(std::move(file));
}

} // namespace rms::upload
