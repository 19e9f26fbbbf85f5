#include "rms/api/upload_api.hpp"

#include "rms/core/base64.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <limits>
#include <optional>

namespace rms::api {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump(-1, ' ', false, json::error_handler_t::replace));
    return response;
}

HttpResponse error_response(ErrorCode code, const std::string& message) {
    return network::make_error_response(Error{code, message});
}

/// Owner identity of the request, or the 401/400 to send back.
std::optional<HttpResponse> require_owner(const HttpContext& ctx, std::string& owner_id) {
    owner_id = ctx.request.get_header(kUserHeader);
    if (owner_id.empty()) {
        return error_response(ErrorCode::Unauthorized, std::string("Missing ") + kUserHeader + " header");
    }
    // Owner ids are persisted as JSON strings and compared byte for byte.
    try {
        (void)json(owner_id).dump();
    } catch (const json::type_error&) {
        return error_response(ErrorCode::InvalidArgument, std::string(kUserHeader) + " must be valid UTF-8");
    }
    return std::nullopt;
}

Result<json> parse_body(const HttpContext& ctx) {
    json body = json::parse(ctx.request.body.begin(), ctx.request.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<json>(ErrorCode::InvalidArgument, "Request body must be a JSON object");
    }
    return Ok(std::move(body));
}

Result<std::uint32_t> parse_index(const std::string& text) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "Invalid chunk index '" + text + "'");
    }
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0' || value > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::uint32_t>(ErrorCode::InvalidArgument, "Invalid chunk index '" + text + "'");
    }
    return Ok(static_cast<std::uint32_t>(value));
}

json receipt_json(const upload::ChunkReceipt& receipt) {
    return json{
        {"uploadedChunks", receipt.uploaded_chunks},
        {"totalChunks", receipt.total_chunks},
        {"uploadedBytes", receipt.uploaded_bytes},
        {"duplicate", receipt.duplicate}
    };
}

json file_json(const upload::FinalizedFile& file) {
    json j = file;
    j.erase("ownerId");
    j.erase("storageKey");
    j.erase("sessionToken");
    j.erase("assembledKey");
    return j;
}

json session_json(const upload::UploadSession& session) {
    json j = session;
    j["fileSize"] = session.total_size;
    j["uploadedBytes"] = session.uploaded_bytes();
    j.erase("ownerId");
    j.erase("lastError");
    return j;
}

stream::StreamRequest stream_request(const HttpContext& ctx) {
    stream::StreamRequest request;
    request.range_header = ctx.request.get_header("Range");
    request.head_only = ctx.request.method == network::HttpMethod::HEAD;
    request.download = ctx.request.get_query("download") == "true";
    return request;
}

HttpResponse success() {
    return json_response(HttpStatus::OK, json{{"success", true}});
}

} // namespace

void register_upload_routes(network::HttpRouter& router, ApiServices services) {
    auto& authority = services.authority;
    auto& direct_uploads = services.direct_uploads;
    auto& streams = services.streams;
    const auto* metrics = services.metrics;

    // ─── Session lifecycle ───────────────────────────────

    router.post("/api/uploads", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return network::make_error_response(body.error());
        }

        upload::CreateSessionRequest request;
        request.owner_id = owner;
        try {
            const json& j = body.value();
            request.filename = j.at("filename").get<std::string>();
            request.total_size = j.at("fileSize").get<std::int64_t>();
            request.mime_type = j.value("mimeType", std::string("application/octet-stream"));
            request.chunk_size = j.value("chunkSize", std::uint64_t{0});
        } catch (const json::exception& e) {
            return error_response(ErrorCode::InvalidArgument, std::string("Malformed session request: ") + e.what());
        }

        auto handle = authority.create_session(request);
        if (handle.is_error()) {
            return network::make_error_response(handle.error());
        }
        return json_response(HttpStatus::CREATED, json{
            {"sessionToken", handle.value().session_token},
            {"chunkSize", handle.value().chunk_size},
            {"totalChunks", handle.value().total_chunks}
        });
    });

    router.get("/api/uploads", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        json sessions = json::array();
        for (const auto& session : authority.list_active(owner)) {
            sessions.push_back(session_json(session));
        }
        return json_response(HttpStatus::OK, json{{"sessions", sessions}});
    });

    router.get("/api/uploads/:token", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto session = authority.status(owner, ctx.get_param("token"));
        if (session.is_error()) {
            return network::make_error_response(session.error());
        }
        return json_response(HttpStatus::OK, session_json(session.value()));
    });

    // ─── Chunk upload ────────────────────────────────────

    router.put("/api/uploads/:token/chunks/:index", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto index = parse_index(ctx.get_param("index"));
        if (index.is_error()) {
            return network::make_error_response(index.error());
        }
        auto receipt = authority.accept_chunk(owner, ctx.get_param("token"), index.value(), ctx.request.body);
        if (receipt.is_error()) {
            return network::make_error_response(receipt.error());
        }
        return json_response(HttpStatus::OK, receipt_json(receipt.value()));
    });

    router.post("/api/uploads/:token/chunks", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return network::make_error_response(body.error());
        }

        std::uint32_t index = 0;
        std::string encoded;
        try {
            index = body.value().at("chunkIndex").get<std::uint32_t>();
            encoded = body.value().at("chunkData").get<std::string>();
        } catch (const json::exception& e) {
            return error_response(ErrorCode::InvalidArgument, std::string("Malformed chunk request: ") + e.what());
        }

        auto bytes = base64_decode(encoded);
        if (bytes.is_error()) {
            return network::make_error_response(bytes.error());
        }
        auto receipt = authority.accept_chunk(owner, ctx.get_param("token"), index, bytes.value());
        if (receipt.is_error()) {
            return network::make_error_response(receipt.error());
        }
        return json_response(HttpStatus::OK, receipt_json(receipt.value()));
    });

    // ─── Session control ─────────────────────────────────

    router.post("/api/uploads/:token/pause", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto result = authority.pause(owner, ctx.get_param("token"));
        return result.is_ok() ? success() : network::make_error_response(result.error());
    });

    router.post("/api/uploads/:token/cancel", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto result = authority.cancel(owner, ctx.get_param("token"));
        return result.is_ok() ? success() : network::make_error_response(result.error());
    });

    router.post("/api/uploads/:token/finalize", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto file = authority.finalize(owner, ctx.get_param("token"));
        if (file.is_error()) {
            return network::make_error_response(file.error());
        }
        return json_response(HttpStatus::OK, json{
            {"fileId", file.value().id},
            {"url", file.value().url},
            {"storageMode", upload::to_string(file.value().storage_mode)},
            {"fileSize", file.value().file_size}
        });
    });

    router.post("/api/uploads/:token/thumbnail", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return network::make_error_response(body.error());
        }
        const auto it = body.value().find("thumbnailData");
        if (it == body.value().end() || !it->is_string()) {
            return error_response(ErrorCode::InvalidArgument, "thumbnailData is required");
        }
        auto image = base64_decode(it->get<std::string>());
        if (image.is_error()) {
            return network::make_error_response(image.error());
        }
        auto result = authority.save_thumbnail(owner, ctx.get_param("token"), image.value());
        return result.is_ok() ? success() : network::make_error_response(result.error());
    });

    // ─── Small-file path ─────────────────────────────────

    router.post("/api/files", [&direct_uploads](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        // Reject on the raw body size before parsing the JSON around the payload
        if (ctx.request.body.size() > direct_uploads.max_encoded_size() + 64 * 1024) {
            return error_response(ErrorCode::PayloadTooLarge,
                                  "Direct uploads are limited to " +
                                  std::to_string(direct_uploads.max_encoded_size()) + " encoded bytes");
        }
        auto body = parse_body(ctx);
        if (body.is_error()) {
            return network::make_error_response(body.error());
        }

        upload::DirectUploadRequest request;
        request.owner_id = owner;
        try {
            request.filename = body.value().at("filename").get<std::string>();
            request.mime_type = body.value().value("mimeType", std::string("application/octet-stream"));
            request.encoded_data = body.value().at("data").get<std::string>();
        } catch (const json::exception& e) {
            return error_response(ErrorCode::InvalidArgument, std::string("Malformed file request: ") + e.what());
        }

        auto file = direct_uploads.store(request);
        if (file.is_error()) {
            return network::make_error_response(file.error());
        }
        return json_response(HttpStatus::CREATED, json{
            {"fileId", file.value().id},
            {"url", file.value().url},
            {"fileSize", file.value().file_size}
        });
    });

    router.get("/api/files", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        json files = json::array();
        for (const auto& file : authority.list_files(owner)) {
            files.push_back(file_json(file));
        }
        return json_response(HttpStatus::OK, json{{"files", files}});
    });

    router.delete_("/api/files/:fileId", [&authority](const HttpContext& ctx) {
        std::string owner;
        if (auto denied = require_owner(ctx, owner)) {
            return *denied;
        }
        auto result = authority.delete_file(owner, ctx.get_param("fileId"));
        return result.is_ok() ? success() : network::make_error_response(result.error());
    });

    // ─── Streaming ───────────────────────────────────────

    auto stream_handler = [&streams](const HttpContext& ctx) {
        return streams.stream_session(ctx.get_param("token"), stream_request(ctx));
    };
    router.get("/files/stream/:token", stream_handler);
    router.head("/files/stream/:token", stream_handler);

    auto direct_handler = [&streams](const HttpContext& ctx) {
        return streams.serve_direct(ctx.get_param("fileId"), stream_request(ctx));
    };
    router.get("/files/direct/:fileId", direct_handler);
    router.head("/files/direct/:fileId", direct_handler);

    // ─── Operations ──────────────────────────────────────

    router.get("/api/metrics", [metrics](const HttpContext&) {
        return json_response(HttpStatus::OK, metrics ? metrics->to_json() : json::object());
    });

    router.get("/healthz", [&authority](const HttpContext&) {
        return json_response(HttpStatus::OK, json{
            {"status", "ok"},
            {"sessions", authority.session_count()}
        });
    });

    spdlog::info("[UploadApi] Registered {} routes", router.route_count());
}

} // namespace rms::api
