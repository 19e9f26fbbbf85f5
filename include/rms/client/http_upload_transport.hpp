#pragma once

#include "rms/client/upload_transport.hpp"
#include "rms/network/http_client.hpp"

#include <string>

namespace rms::client {

/**
 * @brief UploadTransport over the server's JSON API
 *
 * Chunks go up as binary PUT bodies. Every request carries X-User-Id.
 */
class HttpUploadTransport : public UploadTransport {
public:
    HttpUploadTransport(network::HttpClient& http, std::string user_id);

    Result<CreatedSession> create_session(const std::string& filename,
                                          std::uint64_t file_size,
                                          const std::string& mime_type,
                                          std::uint64_t chunk_size,
                                          CancellationToken* cancel) override;

    Result<ChunkAck> upload_chunk(const std::string& session_token,
                                  std::uint32_t index,
                                  const std::vector<std::uint8_t>& bytes,
                                  CancellationToken* cancel) override;

    Result<RemoteSession> session_status(const std::string& session_token, CancellationToken* cancel) override;

    Result<UploadedFile> finalize(const std::string& session_token, CancellationToken* cancel) override;

    Result<void> pause_session(const std::string& session_token) override;

    Result<void> cancel_session(const std::string& session_token) override;

    Result<UploadedFile> upload_small(const std::string& filename,
                                      const std::string& mime_type,
                                      const std::string& encoded_data) override;

private:
    Result<network::ClientResponse> call(network::HttpMethod method,
                                         const std::string& target,
                                         std::string body,
                                         const std::string& content_type,
                                         CancellationToken* cancel);

    network::HttpClient& http_;
    std::string user_id_;
};

/// Error carried by a non-2xx response: the server's code when present.
Error error_from_response(const network::ClientResponse& response);

} // namespace rms::client
