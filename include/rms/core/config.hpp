#pragma once

#include "rms/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rms {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

/**
 * @brief Server-side tunables
 *
 * Values come from an optional JSON file and are then overridden by
 * command-line flags in main().
 */
struct ServerConfig {
    std::uint16_t port = 8080;
    std::string bind_address = "0.0.0.0";
    std::filesystem::path data_root = "rms_data";
    std::string public_base_url;                       ///< Prefix for urls handed to clients ("" = relative)

    std::uint64_t chunk_size = 5 * kMiB;               ///< Default ingest chunk size
    std::uint64_t min_chunk_size = 64 * 1024;
    std::uint64_t max_chunk_size = 64 * kMiB;
    std::uint64_t small_file_threshold = 50 * kMiB;    ///< Above this, finalize leaves chunks in place
    std::uint64_t direct_upload_max_encoded = 10 * kMiB;

    std::uint64_t stream_block_size = 1 * kMiB;        ///< Read-side granularity of the streaming server
    std::uint64_t open_range_cap = 2 * kMiB;           ///< Cap for "bytes=N-" requests, 0 = uncapped
    bool stream_incomplete_sessions = false;

    std::chrono::seconds reaper_interval{3600};
    std::chrono::seconds session_ttl{24 * 3600};
    std::chrono::seconds terminal_retention{7 * 24 * 3600};   ///< How long finished sessions stay queryable

    bool background_assembly = false;                  ///< Build single-blob copies of streamed files
    std::uint64_t assembly_max_size = 2048 * kMiB;

    std::size_t worker_threads = 4;
    std::size_t max_request_body = 96 * kMiB;

    std::string log_level = "info";
    std::string log_pattern = "[%H:%M:%S] [%^%l%$] %v";
};

/**
 * @brief Upload client tunables
 */
struct ClientConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string user_id;

    std::size_t concurrency = 3;
    std::chrono::milliseconds base_delay{1500};
    std::chrono::milliseconds max_delay{60000};
    std::size_t max_attempts = 5;
    std::chrono::milliseconds request_timeout{60000};

    std::uint64_t chunk_size = 0;                      ///< 0 = let the server choose
    std::uint64_t direct_upload_max_encoded = 10 * kMiB;
    std::filesystem::path journal_path = ".rms-upload-journal.json";

    std::string log_level = "info";
};

Result<ServerConfig> load_server_config(const std::filesystem::path& path);
Result<ServerConfig> parse_server_config(const std::string& json_text);
Result<void> validate(const ServerConfig& config);

Result<ClientConfig> load_client_config(const std::filesystem::path& path);
Result<ClientConfig> parse_client_config(const std::string& json_text);

} // namespace rms
