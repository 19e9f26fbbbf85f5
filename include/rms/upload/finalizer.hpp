#pragma once

#include "rms/core/result.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/upload/types.hpp"

#include <cstdint>
#include <string>

namespace rms::upload {

struct FinalizerOptions {
    std::uint64_t small_file_threshold = 50ULL * 1024 * 1024;
    std::string public_base_url;
};

/// "files/<owner>/<fileId>-<filename>" with path separators neutralized.
std::string direct_file_key(const std::string& owner_id, const std::string& file_id, const std::string& filename);

/// "chunked/<token>/<filename>", the logical key recorded for streamed files.
std::string streamed_file_key(const std::string& session_token, const std::string& filename);

std::string direct_file_url(const std::string& base_url, const std::string& file_id);
std::string stream_url(const std::string& base_url, const std::string& session_token);

/**
 * @brief Turns a fully uploaded session into a FinalizedFile
 *
 * Direct mode (total_size <= threshold) copies the chunks in index order into
 * one blob through a BlobWriter, holding one chunk at a time. Streamed mode
 * only checks that every chunk exists with its expected length and leaves
 * the chunks as the storage of record.
 *
 * finalize() never deletes chunks. The SessionAuthority calls
 * release_chunks() once the completed status is durable, so a crash between
 * the two leaves a session that can finalize again.
 */
class Finalizer {
public:
    Finalizer(storage::ChunkStore& chunks, FinalizerOptions options);

    [[nodiscard]] StorageMode choose_mode(std::uint64_t total_size) const noexcept;

    Result<FinalizedFile> finalize(const UploadSession& session, TimePoint now);

    /// Delete the chunks of a direct-mode session. Streamed sessions keep theirs (returns 0).
    Result<std::size_t> release_chunks(const UploadSession& session);

    [[nodiscard]] const FinalizerOptions& options() const noexcept { return options_; }

private:
    Result<FinalizedFile> assemble_direct(const UploadSession& session, FinalizedFile file);
    Result<FinalizedFile> register_streamed(const UploadSession& session, FinalizedFile file);

    storage::ChunkStore& chunks_;
    FinalizerOptions options_;
};

} // namespace rms::upload
