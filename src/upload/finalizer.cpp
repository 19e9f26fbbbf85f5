#include "rms/upload/finalizer.hpp"

#include "rms/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rms::upload {

namespace {

std::string sanitize_segment(std::string value) {
    std::replace(value.begin(), value.end(), '/', '_');
    std::replace(value.begin(), value.end(), '\\', '_');
    value.erase(std::remove(value.begin(), value.end(), '\0'), value.end());
    if (value.empty() || value == "." || value == "..") {
        return "_";
    }
    return value;
}

} // namespace

std::string direct_file_key(const std::string& owner_id, const std::string& file_id, const std::string& filename) {
    return "files/" + sanitize_segment(owner_id) + "/" + sanitize_segment(file_id + "-" + filename);
}

std::string streamed_file_key(const std::string& session_token, const std::string& filename) {
    return "chunked/" + sanitize_segment(session_token) + "/" + sanitize_segment(filename);
}

std::string direct_file_url(const std::string& base_url, const std::string& file_id) {
    return base_url + "/files/direct/" + file_id;
}

std::string stream_url(const std::string& base_url, const std::string& session_token) {
    return base_url + "/files/stream/" + session_token;
}

Finalizer::Finalizer(storage::ChunkStore& chunks, FinalizerOptions options)
    : chunks_(chunks), options_(std::move(options)) {}

StorageMode Finalizer::choose_mode(std::uint64_t total_size) const noexcept {
    return total_size > options_.small_file_threshold ? StorageMode::Streamed : StorageMode::Direct;
}

Result<FinalizedFile> Finalizer::finalize(const UploadSession& session, TimePoint now) {
    if (!session.is_complete()) {
        return Err<FinalizedFile>(ErrorCode::IncompleteUpload,
                                  "Upload incomplete: " + std::to_string(session.uploaded_chunks.size()) +
                                  "/" + std::to_string(session.total_chunks) + " chunks");
    }

    FinalizedFile file;
    file.id = generate_id("file");
    file.mime_type = session.mime_type;
    file.file_size = session.total_size;
    file.filename = session.filename;
    file.owner_id = session.owner_id;
    file.created_at = now;
    file.storage_mode = choose_mode(session.total_size);

    if (file.storage_mode == StorageMode::Direct) {
        return assemble_direct(session, std::move(file));
    }
    return register_streamed(session, std::move(file));
}

Result<FinalizedFile> Finalizer::assemble_direct(const UploadSession& session, FinalizedFile file) {
    file.storage_key = direct_file_key(session.owner_id, file.id, session.filename);
    file.url = direct_file_url(options_.public_base_url, file.id);

    auto writer_result = chunks_.blobs().open_writer(file.storage_key);
    if (writer_result.is_error()) {
        return forward_error<FinalizedFile>(writer_result);
    }
    auto& writer = *writer_result.value();

    for (std::uint32_t index = 0; index < session.total_chunks; ++index) {
        auto bytes = chunks_.get(session.session_token, index);
        if (bytes.is_error()) {
            writer.abort();
            return Err<FinalizedFile>(ErrorCode::StorageFailure,
                                      "Reassembly failed reading chunk " + std::to_string(index) +
                                      ": " + bytes.error().message);
        }
        if (bytes.value().size() != session.expected_chunk_length(index)) {
            writer.abort();
            return Err<FinalizedFile>(ErrorCode::StorageFailure,
                                      "Chunk " + std::to_string(index) + " has unexpected length");
        }
        if (auto res = writer.write(bytes.value().data(), bytes.value().size()); res.is_error()) {
            writer.abort();
            return forward_error<FinalizedFile>(res);
        }
    }

    if (auto res = writer.commit(); res.is_error()) {
        return forward_error<FinalizedFile>(res);
    }

    spdlog::debug("[Finalizer] {} assembled into {} ({} bytes)",
                  session.session_token, file.storage_key, writer.bytes_written());
    return Ok(std::move(file));
}

Result<std::size_t> Finalizer::release_chunks(const UploadSession& session) {
    if (choose_mode(session.total_size) == StorageMode::Streamed) {
        return Ok(std::size_t{0});
    }
    return chunks_.delete_all(session.session_token);
}

Result<FinalizedFile> Finalizer::register_streamed(const UploadSession& session, FinalizedFile file) {
    for (std::uint32_t index = 0; index < session.total_chunks; ++index) {
        auto size = chunks_.chunk_size(session.session_token, index);
        if (size.is_error()) {
            return Err<FinalizedFile>(ErrorCode::StorageFailure,
                                      "Chunk " + std::to_string(index) + " missing from storage");
        }
        if (size.value() != session.expected_chunk_length(index)) {
            return Err<FinalizedFile>(ErrorCode::StorageFailure,
                                      "Chunk " + std::to_string(index) + " has unexpected length");
        }
    }

    file.storage_key = streamed_file_key(session.session_token, session.filename);
    file.url = stream_url(options_.public_base_url, session.session_token);
    file.session_token = session.session_token;
    file.chunk_size = session.chunk_size;
    file.total_chunks = session.total_chunks;
    return Ok(std::move(file));
}

} // namespace rms::upload
