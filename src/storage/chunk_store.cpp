#include "rms/storage/chunk_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace rms::storage {

std::string chunk_prefix(const std::string& session_token) {
    return "chunks/" + session_token + "/";
}

std::string chunk_key(const std::string& session_token, std::uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk-%06u", index);
    return chunk_prefix(session_token) + name;
}

ChunkStore::ChunkStore(BlobStore& blobs) : blobs_(blobs) {}

Result<void> ChunkStore::put(const std::string& session_token,
                             std::uint32_t index,
                             const std::vector<std::uint8_t>& bytes) {
    auto res = blobs_.put(chunk_key(session_token, index), bytes);
    if (res.is_error()) {
        spdlog::warn("[ChunkStore] put {}#{} failed: {}", session_token, index, res.error().message);
    }
    return res;
}

Result<std::vector<std::uint8_t>> ChunkStore::get(const std::string& session_token, std::uint32_t index) const {
    return blobs_.get(chunk_key(session_token, index));
}

Result<std::vector<std::uint8_t>> ChunkStore::get_range(const std::string& session_token,
                                                        std::uint32_t index,
                                                        std::uint64_t offset,
                                                        std::uint64_t length) const {
    return blobs_.get_range(chunk_key(session_token, index), offset, length);
}

Result<std::uint64_t> ChunkStore::chunk_size(const std::string& session_token, std::uint32_t index) const {
    return blobs_.size(chunk_key(session_token, index));
}

bool ChunkStore::has(const std::string& session_token, std::uint32_t index) const {
    return blobs_.exists(chunk_key(session_token, index));
}

Result<std::size_t> ChunkStore::delete_all(const std::string& session_token) {
    auto removed = blobs_.remove_prefix(chunk_prefix(session_token));
    if (removed.is_ok()) {
        spdlog::debug("[ChunkStore] removed {} chunks of {}", removed.value(), session_token);
    }
    return removed;
}

} // namespace rms::storage
