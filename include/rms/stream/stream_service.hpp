#pragma once

#include "rms/events/event_bus.hpp"
#include "rms/network/http_types.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/upload/file_catalog.hpp"
#include "rms/upload/session_authority.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace rms::stream {

struct StreamOptions {
    std::uint64_t block_size = 1024ULL * 1024;
    std::uint64_t open_range_cap = 2ULL * 1024 * 1024;
    bool stream_incomplete_sessions = false;
};

struct StreamRequest {
    std::string range_header;
    bool head_only = false;
    bool download = false;      ///< Content-Disposition: attachment
};

/**
 * @brief Serves byte ranges of stored files over HTTP
 *
 * Streamed files are synthesized from their chunks until they have an
 * assembled copy, after which the stream url redirects like a direct file.
 * Direct files and assembled copies are read from their single blob. Responses carry a BodySource so chunk data is read
 * only as fast as the connection drains it. HEAD requests are answered from
 * metadata and never touch chunk data.
 *
 * With stream_incomplete_sessions enabled, active and paused sessions can be
 * played back for ranges whose chunks have all arrived; other ranges answer
 * 503 with Retry-After.
 */
class StreamService {
public:
    StreamService(const storage::ChunkStore& chunks,
                  const storage::BlobStore& blobs,
                  const upload::FileCatalog& catalog,
                  const upload::SessionAuthority* authority,
                  events::EventBus& bus,
                  StreamOptions options = {});

    /// GET|HEAD /files/stream/:token
    network::HttpResponse stream_session(const std::string& session_token, const StreamRequest& request);

    /// GET|HEAD /files/direct/:fileId
    network::HttpResponse serve_direct(const std::string& file_id, const StreamRequest& request);

    [[nodiscard]] const StreamOptions& options() const noexcept { return options_; }

private:
    struct Target {
        std::string session_token;
        std::string filename;
        std::string mime_type;
        std::uint64_t total_size = 0;
        std::uint64_t chunk_size = 0;
        bool complete = true;
        std::set<std::uint32_t> present;   ///< Only consulted when !complete
    };

    network::HttpResponse serve_chunks(const Target& target, const StreamRequest& request);

    network::HttpResponse finish(const std::string& token, network::HttpResponse response, std::uint64_t bytes);

    const storage::ChunkStore& chunks_;
    const storage::BlobStore& blobs_;
    const upload::FileCatalog& catalog_;
    const upload::SessionAuthority* authority_;
    events::EventBus& event_bus_;
    StreamOptions options_;
};

/// Headers shared by every successful stream response.
void set_media_headers(network::HttpResponse& response,
                       const std::string& mime_type,
                       const std::string& filename,
                       bool download);

} // namespace rms::stream
