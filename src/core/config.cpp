#include "rms/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace rms {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<std::string> read_text(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(buffer.str());
}

Result<json> parse_object(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<json>(ErrorCode::InvalidArgument, "Config must be a JSON object");
    }
    return Ok(std::move(doc));
}

} // namespace

Result<ServerConfig> parse_server_config(const std::string& json_text) {
    auto parsed = parse_object(json_text);
    if (parsed.is_error()) {
        return forward_error<ServerConfig>(parsed);
    }
    const json& j = parsed.value();

    ServerConfig config;
    try {
        config.port = j.value("port", config.port);
        config.bind_address = j.value("bind_address", config.bind_address);
        config.data_root = j.value("data_root", config.data_root.string());
        config.public_base_url = j.value("public_base_url", config.public_base_url);
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.min_chunk_size = j.value("min_chunk_size", config.min_chunk_size);
        config.max_chunk_size = j.value("max_chunk_size", config.max_chunk_size);
        config.small_file_threshold = j.value("small_file_threshold", config.small_file_threshold);
        config.direct_upload_max_encoded = j.value("direct_upload_max_encoded", config.direct_upload_max_encoded);
        config.stream_block_size = j.value("stream_block_size", config.stream_block_size);
        config.open_range_cap = j.value("open_range_cap", config.open_range_cap);
        config.stream_incomplete_sessions = j.value("stream_incomplete_sessions", config.stream_incomplete_sessions);
        config.reaper_interval = std::chrono::seconds(
            j.value("reaper_interval_seconds", static_cast<std::int64_t>(config.reaper_interval.count())));
        config.session_ttl = std::chrono::seconds(
            j.value("session_ttl_seconds", static_cast<std::int64_t>(config.session_ttl.count())));
        config.terminal_retention = std::chrono::seconds(
            j.value("terminal_retention_seconds", static_cast<std::int64_t>(config.terminal_retention.count())));
        config.background_assembly = j.value("background_assembly", config.background_assembly);
        config.assembly_max_size = j.value("assembly_max_size", config.assembly_max_size);
        config.worker_threads = j.value("worker_threads", config.worker_threads);
        config.max_request_body = j.value("max_request_body", config.max_request_body);
        config.log_level = j.value("log_level", config.log_level);
        config.log_pattern = j.value("log_pattern", config.log_pattern);
    } catch (const json::exception& e) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, std::string("Invalid config value: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return forward_error<ServerConfig>(valid);
    }
    return Ok(std::move(config));
}

Result<ServerConfig> load_server_config(const fs::path& path) {
    auto text = read_text(path);
    if (text.is_error()) {
        return forward_error<ServerConfig>(text);
    }
    return parse_server_config(text.value());
}

Result<void> validate(const ServerConfig& config) {
    if (config.chunk_size < config.min_chunk_size || config.chunk_size > config.max_chunk_size) {
        return Err<void>(ErrorCode::InvalidArgument, "chunk_size outside [min_chunk_size, max_chunk_size]");
    }
    if (config.stream_block_size == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "stream_block_size must be > 0");
    }
    if (config.worker_threads == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "worker_threads must be > 0");
    }
    if (config.reaper_interval.count() <= 0 || config.session_ttl.count() <= 0) {
        return Err<void>(ErrorCode::InvalidArgument, "reaper interval and session ttl must be positive");
    }
    if (config.terminal_retention.count() < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "terminal_retention_seconds must not be negative");
    }
    if (config.max_request_body < config.max_chunk_size) {
        return Err<void>(ErrorCode::InvalidArgument, "max_request_body must hold at least one chunk");
    }
    return Ok();
}

Result<ClientConfig> parse_client_config(const std::string& json_text) {
    auto parsed = parse_object(json_text);
    if (parsed.is_error()) {
        return forward_error<ClientConfig>(parsed);
    }
    const json& j = parsed.value();

    ClientConfig config;
    try {
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.user_id = j.value("user_id", config.user_id);
        config.concurrency = j.value("concurrency", config.concurrency);
        config.base_delay = std::chrono::milliseconds(
            j.value("base_delay_ms", static_cast<std::int64_t>(config.base_delay.count())));
        config.max_delay = std::chrono::milliseconds(
            j.value("max_delay_ms", static_cast<std::int64_t>(config.max_delay.count())));
        config.max_attempts = j.value("max_attempts", config.max_attempts);
        config.request_timeout = std::chrono::milliseconds(
            j.value("request_timeout_ms", static_cast<std::int64_t>(config.request_timeout.count())));
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        config.direct_upload_max_encoded = j.value("direct_upload_max_encoded", config.direct_upload_max_encoded);
        config.journal_path = j.value("journal_path", config.journal_path.string());
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, std::string("Invalid config value: ") + e.what());
    }

    if (config.concurrency == 0 || config.max_attempts == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "concurrency and max_attempts must be > 0");
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_client_config(const fs::path& path) {
    auto text = read_text(path);
    if (text.is_error()) {
        return forward_error<ClientConfig>(text);
    }
    return parse_client_config(text.value());
}

} // namespace rms
