#pragma once

#include "rms/network/http_types.hpp"
#include "rms/storage/chunk_store.hpp"
#include "rms/stream/byte_range.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rms::stream {

/**
 * @brief Response body synthesized from ordered chunk slices
 *
 * Each next_block() performs exactly one ranged chunk read, so the memory
 * held per connection is bounded by the largest slice. A chunk that is
 * missing or shorter than planned fails the block with StorageFailure
 * instead of yielding fewer bytes.
 */
class ChunkRangeSource : public network::BodySource {
public:
    ChunkRangeSource(const storage::ChunkStore& chunks,
                     std::string session_token,
                     std::vector<ChunkSlice> slices);

    Result<std::vector<std::uint8_t>> next_block() override;

    [[nodiscard]] std::uint64_t remaining() const noexcept override { return remaining_; }

private:
    const storage::ChunkStore& chunks_;
    std::string session_token_;
    std::vector<ChunkSlice> slices_;
    std::size_t next_ = 0;
    std::uint64_t remaining_ = 0;
};

/**
 * @brief Response body read from one blob in fixed-size blocks
 */
class BlobRangeSource : public network::BodySource {
public:
    BlobRangeSource(const storage::BlobStore& blobs,
                    std::string key,
                    ByteRange range,
                    std::uint64_t block_size);

    Result<std::vector<std::uint8_t>> next_block() override;

    [[nodiscard]] std::uint64_t remaining() const noexcept override { return remaining_; }

private:
    const storage::BlobStore& blobs_;
    std::string key_;
    std::uint64_t offset_;
    std::uint64_t remaining_;
    std::uint64_t block_size_;
};

} // namespace rms::stream
