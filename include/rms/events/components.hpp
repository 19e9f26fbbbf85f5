/**
 * @file components.hpp
 * @brief Event-driven observers of the upload engine
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // every session, chunk, finalize and stream event is now logged and counted
 */

#pragma once

#include "rms/events/event_bus.hpp"
#include "rms/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace rms::events {

/**
 * @brief Logs every domain event through spdlog
 *
 * Per-chunk events go to debug so a multi-gigabyte upload does not flood
 * the info log.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Media store listening on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("Media store shutting down: {}", e.reason);
        });

        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent& e) {
            on_session_created(e);
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            on_chunk_accepted(e);
        });

        bus_.subscribe<SessionPausedEvent>([](const SessionPausedEvent& e) {
            spdlog::info("[SessionPaused] token={}", e.session_token);
        });

        bus_.subscribe<SessionCancelledEvent>([](const SessionCancelledEvent& e) {
            spdlog::info("[SessionCancelled] token={} chunks_removed={}", e.session_token, e.chunks_removed);
        });

        bus_.subscribe<SessionExpiredEvent>([](const SessionExpiredEvent& e) {
            spdlog::info("[SessionExpired] token={} idle={}s chunks_removed={}",
                         e.session_token, e.idle.count(), e.chunks_removed);
        });

        bus_.subscribe<UploadFinalizedEvent>([this](const UploadFinalizedEvent& e) {
            on_upload_finalized(e);
        });

        bus_.subscribe<FinalizeFailedEvent>([](const FinalizeFailedEvent& e) {
            spdlog::warn("[FinalizeFailed] token={} error={}", e.session_token, e.error_message);
        });

        bus_.subscribe<DirectUploadStoredEvent>([](const DirectUploadStoredEvent& e) {
            spdlog::info("[DirectUpload] file={} owner={} bytes={}", e.file_id, e.owner_id, e.bytes);
        });

        bus_.subscribe<FileDeletedEvent>([](const FileDeletedEvent& e) {
            spdlog::info("[FileDeleted] file={} owner={} blobs_removed={}", e.file_id, e.owner_id, e.blobs_removed);
        });

        bus_.subscribe<FileAssembledEvent>([](const FileAssembledEvent& e) {
            spdlog::info("[FileAssembled] file={} token={} bytes={} duration={}ms",
                         e.file_id, e.session_token, e.bytes, e.duration.count());
        });

        bus_.subscribe<AssemblyFailedEvent>([](const AssemblyFailedEvent& e) {
            spdlog::warn("[AssemblyFailed] file={} error={}", e.file_id, e.error_message);
        });

        bus_.subscribe<StreamServedEvent>([](const StreamServedEvent& e) {
            spdlog::debug("[StreamServed] token={} status={} bytes={}", e.session_token, e.status, e.bytes);
        });
    }

private:
    void on_session_created(const SessionCreatedEvent& e) {
        spdlog::info("[SessionCreated] token={} owner={} file={} size={} chunk_size={} chunks={}",
                     e.session_token, e.owner_id, e.filename,
                     e.total_size, e.chunk_size, e.total_chunks);
    }

    void on_chunk_accepted(const ChunkAcceptedEvent& e) {
        spdlog::debug("[ChunkAccepted] token={} chunk={} progress={}/{} bytes={}{}",
                      e.session_token, e.chunk_index, e.uploaded_chunks, e.total_chunks,
                      e.bytes, e.duplicate ? " (duplicate)" : "");
    }

    void on_upload_finalized(const UploadFinalizedEvent& e) {
        spdlog::info("[UploadFinalized] token={} file={} mode={} size={} duration={}ms",
                     e.session_token, e.file_id, e.storage_mode, e.total_size, e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Counts engine activity for GET /api/metrics
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> sessions_created{0};
        std::atomic<std::uint64_t> chunks_accepted{0};
        std::atomic<std::uint64_t> duplicate_chunks{0};
        std::atomic<std::uint64_t> chunk_bytes{0};
        std::atomic<std::uint64_t> sessions_paused{0};
        std::atomic<std::uint64_t> sessions_cancelled{0};
        std::atomic<std::uint64_t> sessions_expired{0};
        std::atomic<std::uint64_t> uploads_direct{0};
        std::atomic<std::uint64_t> uploads_streamed{0};
        std::atomic<std::uint64_t> finalize_failures{0};
        std::atomic<std::uint64_t> direct_uploads{0};
        std::atomic<std::uint64_t> direct_upload_bytes{0};
        std::atomic<std::uint64_t> files_deleted{0};
        std::atomic<std::uint64_t> files_assembled{0};
        std::atomic<std::uint64_t> assembly_failures{0};
        std::atomic<std::uint64_t> streams_served{0};
        std::atomic<std::uint64_t> stream_bytes{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent&) {
            stats_.sessions_created++;
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            on_chunk_accepted(e);
        });

        bus_.subscribe<SessionPausedEvent>([this](const SessionPausedEvent&) {
            stats_.sessions_paused++;
        });

        bus_.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.sessions_cancelled++;
        });

        bus_.subscribe<SessionExpiredEvent>([this](const SessionExpiredEvent&) {
            stats_.sessions_expired++;
        });

        bus_.subscribe<UploadFinalizedEvent>([this](const UploadFinalizedEvent& e) {
            if (e.storage_mode == "streamed") {
                stats_.uploads_streamed++;
            } else {
                stats_.uploads_direct++;
            }
        });

        bus_.subscribe<FinalizeFailedEvent>([this](const FinalizeFailedEvent&) {
            stats_.finalize_failures++;
        });

        bus_.subscribe<DirectUploadStoredEvent>([this](const DirectUploadStoredEvent& e) {
            stats_.direct_uploads++;
            stats_.direct_upload_bytes += e.bytes;
        });

        bus_.subscribe<FileDeletedEvent>([this](const FileDeletedEvent&) {
            stats_.files_deleted++;
        });

        bus_.subscribe<FileAssembledEvent>([this](const FileAssembledEvent&) {
            stats_.files_assembled++;
        });

        bus_.subscribe<AssemblyFailedEvent>([this](const AssemblyFailedEvent&) {
            stats_.assembly_failures++;
        });

        bus_.subscribe<StreamServedEvent>([this](const StreamServedEvent& e) {
            stats_.streams_served++;
            stats_.stream_bytes += e.bytes;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    nlohmann::json to_json() const {
        return {
            {"sessionsCreated", stats_.sessions_created.load()},
            {"chunksAccepted", stats_.chunks_accepted.load()},
            {"duplicateChunks", stats_.duplicate_chunks.load()},
            {"chunkBytes", stats_.chunk_bytes.load()},
            {"sessionsPaused", stats_.sessions_paused.load()},
            {"sessionsCancelled", stats_.sessions_cancelled.load()},
            {"sessionsExpired", stats_.sessions_expired.load()},
            {"uploadsDirect", stats_.uploads_direct.load()},
            {"uploadsStreamed", stats_.uploads_streamed.load()},
            {"finalizeFailures", stats_.finalize_failures.load()},
            {"directUploads", stats_.direct_uploads.load()},
            {"directUploadBytes", stats_.direct_upload_bytes.load()},
            {"filesDeleted", stats_.files_deleted.load()},
            {"filesAssembled", stats_.files_assembled.load()},
            {"assemblyFailures", stats_.assembly_failures.load()},
            {"streamsServed", stats_.streams_served.load()},
            {"streamBytes", stats_.stream_bytes.load()},
        };
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Engine Statistics:");
        spdlog::info("  Sessions created:   {}", stats_.sessions_created.load());
        spdlog::info("  Chunks accepted:    {} ({} duplicate)",
                     stats_.chunks_accepted.load(), stats_.duplicate_chunks.load());
        spdlog::info("  Chunk bytes:        {}", stats_.chunk_bytes.load());
        spdlog::info("  Cancelled/expired:  {}/{}",
                     stats_.sessions_cancelled.load(), stats_.sessions_expired.load());
        spdlog::info("  Finalized direct:   {}", stats_.uploads_direct.load());
        spdlog::info("  Finalized streamed: {}", stats_.uploads_streamed.load());
        spdlog::info("  Assembled copies:   {}", stats_.files_assembled.load());
        spdlog::info("  Streams served:     {}", stats_.streams_served.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_chunk_accepted(const ChunkAcceptedEvent& e) {
        if (e.duplicate) {
            stats_.duplicate_chunks++;
            return;
        }
        stats_.chunks_accepted++;
        stats_.chunk_bytes += e.bytes;
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace rms::events
