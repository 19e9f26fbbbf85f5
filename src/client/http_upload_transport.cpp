#include "rms/client/http_upload_transport.hpp"

#include <nlohmann/json.hpp>

namespace rms::client {

using json = nlohmann::json;
using network::ClientResponse;
using network::HttpMethod;

namespace {

std::string session_path(const std::string& token) {
    return "/api/uploads/" + network::url_encode(token);
}

/// Parse a 2xx JSON body, turning a malformed one into a retryable failure.
Result<json> json_body(const ClientResponse& response) {
    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<json>(ErrorCode::TransportFailure, "server sent a malformed JSON body");
    }
    return Ok(std::move(body));
}

} // namespace

Error error_from_response(const ClientResponse& response) {
    json body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("code")) {
        return Error{error_code_from_string(body.value("code", std::string{})),
                     body.value("error", std::string("HTTP ") + std::to_string(response.status_code))};
    }
    const ErrorCode code = response.status_code >= 500 ? ErrorCode::StorageFailure : ErrorCode::InvalidArgument;
    return Error{code, "HTTP " + std::to_string(response.status_code)};
}

HttpUploadTransport::HttpUploadTransport(network::HttpClient& http, std::string user_id)
    : http_(http)
    , user_id_(std::move(user_id)) {
}

Result<ClientResponse> HttpUploadTransport::call(HttpMethod method,
                                                 const std::string& target,
                                                 std::string body,
                                                 const std::string& content_type,
                                                 CancellationToken* cancel) {
    network::ClientRequest request;
    request.method = method;
    request.target = target;
    request.headers["X-User-Id"] = user_id_;
    if (!content_type.empty()) {
        request.headers["Content-Type"] = content_type;
    }
    request.body = std::move(body);

    auto response = http_.send(request, cancel);
    if (response.is_error()) {
        return response;
    }
    if (!response.value().is_success()) {
        return Err<ClientResponse, Error>(error_from_response(response.value()));
    }
    return response;
}

Result<CreatedSession> HttpUploadTransport::create_session(const std::string& filename,
                                                           std::uint64_t file_size,
                                                           const std::string& mime_type,
                                                           std::uint64_t chunk_size,
                                                           CancellationToken* cancel) {
    json request{{"filename", filename}, {"fileSize", file_size}, {"mimeType", mime_type}};
    if (chunk_size > 0) {
        request["chunkSize"] = chunk_size;
    }

    // Local names need not be UTF-8; invalid bytes go out as U+FFFD.
    const auto payload = request.dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = call(HttpMethod::POST, "/api/uploads", payload, "application/json", cancel);
    if (response.is_error()) {
        return forward_error<CreatedSession>(response);
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return forward_error<CreatedSession>(body);
    }

    CreatedSession created;
    created.session_token = body.value().value("sessionToken", std::string{});
    created.chunk_size = body.value().value("chunkSize", std::uint64_t{0});
    created.total_chunks = body.value().value("totalChunks", std::uint32_t{0});
    if (created.session_token.empty() || created.chunk_size == 0) {
        return Err<CreatedSession>(ErrorCode::TransportFailure, "create session response is incomplete");
    }
    return Ok(std::move(created));
}

Result<ChunkAck> HttpUploadTransport::upload_chunk(const std::string& session_token,
                                                   std::uint32_t index,
                                                   const std::vector<std::uint8_t>& bytes,
                                                   CancellationToken* cancel) {
    auto response = call(HttpMethod::PUT,
                         session_path(session_token) + "/chunks/" + std::to_string(index),
                         std::string(bytes.begin(), bytes.end()),
                         "application/octet-stream",
                         cancel);
    if (response.is_error()) {
        return forward_error<ChunkAck>(response);
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return forward_error<ChunkAck>(body);
    }

    ChunkAck ack;
    ack.uploaded_chunks = body.value().value("uploadedChunks", std::uint32_t{0});
    ack.total_chunks = body.value().value("totalChunks", std::uint32_t{0});
    ack.uploaded_bytes = body.value().value("uploadedBytes", std::uint64_t{0});
    return Ok(ack);
}

Result<RemoteSession> HttpUploadTransport::session_status(const std::string& session_token,
                                                          CancellationToken* cancel) {
    auto response = call(HttpMethod::GET, session_path(session_token), {}, {}, cancel);
    if (response.is_error()) {
        return forward_error<RemoteSession>(response);
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return forward_error<RemoteSession>(body);
    }

    const json& j = body.value();
    RemoteSession session;
    try {
        session.session_token = j.value("sessionToken", session_token);
        session.status = j.at("status").get<std::string>();
        session.filename = j.value("filename", std::string{});
        session.total_size = j.value("totalSize", std::uint64_t{0});
        session.chunk_size = j.at("chunkSize").get<std::uint64_t>();
        session.total_chunks = j.at("totalChunks").get<std::uint32_t>();
        session.uploaded_chunks = j.value("uploadedChunks", std::set<std::uint32_t>{});
    } catch (const json::exception& e) {
        return Err<RemoteSession>(ErrorCode::TransportFailure, std::string("malformed session status: ") + e.what());
    }
    return Ok(std::move(session));
}

Result<UploadedFile> HttpUploadTransport::finalize(const std::string& session_token, CancellationToken* cancel) {
    auto response = call(HttpMethod::POST, session_path(session_token) + "/finalize", {}, {}, cancel);
    if (response.is_error()) {
        return forward_error<UploadedFile>(response);
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return forward_error<UploadedFile>(body);
    }
    return Ok(UploadedFile{body.value().value("fileId", std::string{}),
                           body.value().value("url", std::string{})});
}

Result<void> HttpUploadTransport::pause_session(const std::string& session_token) {
    auto response = call(HttpMethod::POST, session_path(session_token) + "/pause", {}, {}, nullptr);
    if (response.is_error()) {
        return Result<void>(ErrValue<Error>(response.error()));
    }
    return Ok();
}

Result<void> HttpUploadTransport::cancel_session(const std::string& session_token) {
    auto response = call(HttpMethod::POST, session_path(session_token) + "/cancel", {}, {}, nullptr);
    if (response.is_error()) {
        return Result<void>(ErrValue<Error>(response.error()));
    }
    return Ok();
}

Result<UploadedFile> HttpUploadTransport::upload_small(const std::string& filename,
                                                       const std::string& mime_type,
                                                       const std::string& encoded_data) {
    const json request{{"filename", filename}, {"mimeType", mime_type}, {"data", encoded_data}};
    const auto payload = request.dump(-1, ' ', false, json::error_handler_t::replace);
    auto response = call(HttpMethod::POST, "/api/files", payload, "application/json", nullptr);
    if (response.is_error()) {
        return forward_error<UploadedFile>(response);
    }
    auto body = json_body(response.value());
    if (body.is_error()) {
        return forward_error<UploadedFile>(body);
    }
    return Ok(UploadedFile{body.value().value("fileId", std::string{}),
                           body.value().value("url", std::string{})});
}

} // namespace rms::client
