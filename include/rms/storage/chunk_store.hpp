#pragma once

#include "rms/storage/blob_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rms::storage {

/// Blob key of one chunk: "chunks/<token>/chunk-000042".
std::string chunk_key(const std::string& session_token, std::uint32_t index);

/// Prefix shared by every chunk of a session (ends with '/').
std::string chunk_prefix(const std::string& session_token);

/**
 * @brief Chunks addressed by (session token, index) on top of a BlobStore
 *
 * No ordering is implied between puts of different indices. Exclusion for
 * concurrent puts of the same index is the caller's job; the blob store only
 * guarantees that each put is atomic.
 */
class ChunkStore {
public:
    explicit ChunkStore(BlobStore& blobs);

    Result<void> put(const std::string& session_token,
                     std::uint32_t index,
                     const std::vector<std::uint8_t>& bytes);

    Result<std::vector<std::uint8_t>> get(const std::string& session_token, std::uint32_t index) const;

    /// Read part of one chunk; the backend seeks when it can.
    Result<std::vector<std::uint8_t>> get_range(const std::string& session_token,
                                                std::uint32_t index,
                                                std::uint64_t offset,
                                                std::uint64_t length) const;

    Result<std::uint64_t> chunk_size(const std::string& session_token, std::uint32_t index) const;
    bool has(const std::string& session_token, std::uint32_t index) const;

    /// Delete every chunk of a session; returns how many were removed.
    Result<std::size_t> delete_all(const std::string& session_token);

    [[nodiscard]] BlobStore& blobs() noexcept { return blobs_; }

private:
    BlobStore& blobs_;
};

} // namespace rms::storage
