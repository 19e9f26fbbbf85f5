#include "rms/stream/stream_service.hpp"

#include "rms/events/events.hpp"
#include "rms/network/http_router.hpp"
#include "rms/stream/byte_range.hpp"
#include "rms/stream/chunk_stream.hpp"

#include <spdlog/spdlog.h>

namespace rms::stream {

using network::HttpResponse;
using network::HttpStatus;

void set_media_headers(HttpResponse& response,
                       const std::string& mime_type,
                       const std::string& filename,
                       bool download) {
    response.set_header("Accept-Ranges", "bytes");
    response.set_header("Content-Type", mime_type.empty() ? "application/octet-stream" : mime_type);
    response.set_header("Content-Disposition",
                        std::string(download ? "attachment" : "inline") +
                        "; filename=\"" + network::url_encode(filename) + "\"");
    response.set_header("Cache-Control", "public, max-age=86400");
}

StreamService::StreamService(const storage::ChunkStore& chunks,
                             const storage::BlobStore& blobs,
                             const upload::FileCatalog& catalog,
                             const upload::SessionAuthority* authority,
                             events::EventBus& bus,
                             StreamOptions options)
    : chunks_(chunks)
    , blobs_(blobs)
    , catalog_(catalog)
    , authority_(authority)
    , event_bus_(bus)
    , options_(options) {
}

HttpResponse StreamService::stream_session(const std::string& session_token, const StreamRequest& request) {
    Target target;
    target.session_token = session_token;

    if (auto file = catalog_.find_by_session(session_token)) {
        if (file->storage_mode == upload::StorageMode::Direct || file->is_assembled()) {
            HttpResponse redirect(HttpStatus::FOUND);
            redirect.set_header("Location", file->is_assembled() ? file->assembled_url : file->url);
            redirect.set_header("Content-Length", "0");
            return finish(session_token, std::move(redirect), 0);
        }
        target.filename = file->filename;
        target.mime_type = file->mime_type;
        target.total_size = file->file_size;
        target.chunk_size = file->chunk_size;
        return serve_chunks(target, request);
    }

    if (options_.stream_incomplete_sessions && authority_ != nullptr) {
        auto session = authority_->snapshot(session_token);
        if (session && upload::accepts_chunks(session->status)) {
            target.filename = session->filename;
            target.mime_type = session->mime_type;
            target.total_size = session->total_size;
            target.chunk_size = session->chunk_size;
            target.complete = session->is_complete();
            target.present = std::move(session->uploaded_chunks);
            return serve_chunks(target, request);
        }
    }

    return finish(session_token,
                  network::make_error_response(Error{ErrorCode::SessionNotFound,
                                                     "No streamable file for " + session_token}),
                  0);
}

HttpResponse StreamService::serve_chunks(const Target& target, const StreamRequest& request) {
    const std::string& token = target.session_token;

    auto parsed = parse_range(request.range_header, target.total_size, options_.open_range_cap);
    if (parsed.is_error()) {
        auto response = network::make_error_response(parsed.error());
        response.set_header("Content-Range", unsatisfied_content_range(target.total_size));
        return finish(token, std::move(response), 0);
    }

    const bool partial = parsed.value().has_value();
    const ByteRange range = partial ? *parsed.value() : ByteRange{0, target.total_size - 1};

    const auto [first_chunk, last_chunk] = chunk_span(range, target.chunk_size);
    if (!target.complete) {
        for (std::uint32_t index = first_chunk; index <= last_chunk; ++index) {
            if (target.present.count(index) == 0) {
                return finish(token,
                              network::make_error_response(Error{
                                  ErrorCode::NotYetAvailable,
                                  "Chunk " + std::to_string(index) + " has not been uploaded yet"}),
                              0);
            }
        }
    }

    HttpResponse response(partial ? HttpStatus::PARTIAL_CONTENT : HttpStatus::OK);
    set_media_headers(response, target.mime_type, target.filename, request.download);
    if (partial) {
        response.set_header("Content-Range", content_range(range, target.total_size));
    }

    if (request.head_only) {
        response.set_header("Content-Length", std::to_string(range.length()));
        return finish(token, std::move(response), 0);
    }

    if (!chunks_.has(token, first_chunk)) {
        spdlog::error("[StreamService] Chunk {} of {} is missing", first_chunk, token);
        return finish(token,
                      network::make_error_response(Error{ErrorCode::StorageFailure,
                                                         "Chunk data unavailable"}),
                      0);
    }

    auto slices = plan_slices(range, target.total_size, target.chunk_size, options_.block_size);
    response.set_body_source(std::make_shared<ChunkRangeSource>(chunks_, token, std::move(slices)),
                             range.length());
    return finish(token, std::move(response), range.length());
}

HttpResponse StreamService::serve_direct(const std::string& file_id, const StreamRequest& request) {
    auto file = catalog_.find(file_id);
    if (!file || (file->storage_mode != upload::StorageMode::Direct && !file->is_assembled())) {
        return finish(file_id,
                      network::make_error_response(Error{ErrorCode::SessionNotFound,
                                                         "No direct file " + file_id}),
                      0);
    }
    const std::string& blob_key = file->is_assembled() ? file->assembled_key : file->storage_key;

    auto parsed = parse_range(request.range_header, file->file_size, options_.open_range_cap);
    if (parsed.is_error()) {
        auto response = network::make_error_response(parsed.error());
        response.set_header("Content-Range", unsatisfied_content_range(file->file_size));
        return finish(file_id, std::move(response), 0);
    }

    const bool partial = parsed.value().has_value();
    const ByteRange range = partial ? *parsed.value() : ByteRange{0, file->file_size - 1};

    HttpResponse response(partial ? HttpStatus::PARTIAL_CONTENT : HttpStatus::OK);
    set_media_headers(response, file->mime_type, file->filename, request.download);
    if (partial) {
        response.set_header("Content-Range", content_range(range, file->file_size));
    }

    if (request.head_only) {
        response.set_header("Content-Length", std::to_string(range.length()));
        return finish(file_id, std::move(response), 0);
    }

    if (!blobs_.exists(blob_key)) {
        spdlog::error("[StreamService] Blob {} for file {} is missing", blob_key, file_id);
        return finish(file_id,
                      network::make_error_response(Error{ErrorCode::StorageFailure, "File data unavailable"}),
                      0);
    }

    response.set_body_source(
        std::make_shared<BlobRangeSource>(blobs_, blob_key, range, options_.block_size),
        range.length());
    return finish(file_id, std::move(response), range.length());
}

HttpResponse StreamService::finish(const std::string& token, HttpResponse response, std::uint64_t bytes) {
    spdlog::debug("[StreamService] {} -> {} ({} bytes)", token, response.status_code, bytes);
    event_bus_.emit(events::StreamServedEvent{token, response.status_code, bytes});
    return response;
}

} // namespace rms::stream
