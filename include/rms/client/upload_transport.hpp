#pragma once

#include "rms/core/cancellation.hpp"
#include "rms/core/result.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace rms::client {

struct CreatedSession {
    std::string session_token;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

struct ChunkAck {
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t uploaded_bytes = 0;
};

/// Server view of a session as returned by the status call.
struct RemoteSession {
    std::string session_token;
    std::string status;
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::set<std::uint32_t> uploaded_chunks;
};

struct UploadedFile {
    std::string file_id;
    std::string url;
};

/**
 * @brief Calls the upload client makes against the server
 *
 * Errors carry the server's ErrorCode when it sent one; connection-level
 * failures are TransportFailure and an aborted call is Cancelled.
 * cancel_session() takes no cancellation token: it must still go out after
 * the transfer it targets has been cancelled.
 */
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual Result<CreatedSession> create_session(const std::string& filename,
                                                  std::uint64_t file_size,
                                                  const std::string& mime_type,
                                                  std::uint64_t chunk_size,
                                                  CancellationToken* cancel) = 0;

    virtual Result<ChunkAck> upload_chunk(const std::string& session_token,
                                          std::uint32_t index,
                                          const std::vector<std::uint8_t>& bytes,
                                          CancellationToken* cancel) = 0;

    virtual Result<RemoteSession> session_status(const std::string& session_token,
                                                 CancellationToken* cancel) = 0;

    virtual Result<UploadedFile> finalize(const std::string& session_token, CancellationToken* cancel) = 0;

    virtual Result<void> pause_session(const std::string& session_token) = 0;

    virtual Result<void> cancel_session(const std::string& session_token) = 0;

    /// Single-request path for small files; encoded_data is base64.
    virtual Result<UploadedFile> upload_small(const std::string& filename,
                                              const std::string& mime_type,
                                              const std::string& encoded_data) = 0;
};

} // namespace rms::client
