/**
 * @file events.hpp
 * @brief Domain events of the upload and streaming engine
 *
 * NAMING CONVENTION:
 * Events are past-tense (ChunkAcceptedEvent, SessionExpiredEvent) and carry
 * only plain values, never pointers into engine state.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rms::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(std::uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a resumable upload session is opened
 *
 * WHO EMITS: SessionAuthority::create_session
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct SessionCreatedEvent {
    std::string session_token;
    std::string owner_id;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted for every chunk the authority acknowledges
 *
 * duplicate is true when the index was already present and the upload was
 * treated as an idempotent retry.
 */
struct ChunkAcceptedEvent {
    std::string session_token;
    std::uint32_t chunk_index = 0;
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes = 0;
    bool duplicate = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionPausedEvent {
    std::string session_token;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionCancelledEvent {
    std::string session_token;
    std::size_t chunks_removed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted by the reaper for each stalled session it reclaims
 */
struct SessionExpiredEvent {
    std::string session_token;
    std::size_t chunks_removed = 0;
    std::chrono::seconds idle{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Finalize Events
// ════════════════════════════════════════════════════════

struct UploadFinalizedEvent {
    std::string session_token;
    std::string file_id;
    std::string storage_mode; ///< "direct" or "streamed"
    std::uint64_t total_size = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FinalizeFailedEvent {
    std::string session_token;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DirectUploadStoredEvent {
    std::string file_id;
    std::string owner_id;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileDeletedEvent {
    std::string file_id;
    std::string owner_id;
    std::size_t blobs_removed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Assembly Events
// ════════════════════════════════════════════════════════

/**
 * @brief A streamed file gained its single-blob copy
 *
 * WHO EMITS: BackgroundAssembler
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct FileAssembledEvent {
    std::string file_id;
    std::string session_token;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct AssemblyFailedEvent {
    std::string file_id;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Streaming Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the stream service has planned a response
 *
 * bytes is the body length promised by the headers, zero for HEAD.
 */
struct StreamServedEvent {
    std::string session_token;
    int status = 200;
    std::uint64_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace rms::events
