#include "rms/stream/chunk_stream.hpp"

#include <algorithm>

namespace rms::stream {

ChunkRangeSource::ChunkRangeSource(const storage::ChunkStore& chunks,
                                   std::string session_token,
                                   std::vector<ChunkSlice> slices)
    : chunks_(chunks)
    , session_token_(std::move(session_token))
    , slices_(std::move(slices)) {
    for (const auto& slice : slices_) {
        remaining_ += slice.length;
    }
}

Result<std::vector<std::uint8_t>> ChunkRangeSource::next_block() {
    if (next_ >= slices_.size()) {
        return Ok(std::vector<std::uint8_t>{});
    }

    const ChunkSlice& slice = slices_[next_];
    auto data = chunks_.get_range(session_token_, slice.chunk_index, slice.offset, slice.length);
    if (data.is_error()) {
        return Err<std::vector<std::uint8_t>>(
            ErrorCode::StorageFailure,
            "chunk " + std::to_string(slice.chunk_index) + " of " + session_token_ +
            " unreadable: " + data.error().message);
    }
    if (data.value().size() != slice.length) {
        return Err<std::vector<std::uint8_t>>(
            ErrorCode::StorageFailure,
            "chunk " + std::to_string(slice.chunk_index) + " of " + session_token_ + " is short: got " +
            std::to_string(data.value().size()) + " of " + std::to_string(slice.length) + " bytes");
    }

    ++next_;
    remaining_ -= slice.length;
    return data;
}

BlobRangeSource::BlobRangeSource(const storage::BlobStore& blobs,
                                 std::string key,
                                 ByteRange range,
                                 std::uint64_t block_size)
    : blobs_(blobs)
    , key_(std::move(key))
    , offset_(range.start)
    , remaining_(range.length())
    , block_size_(block_size == 0 ? range.length() : block_size) {
}

Result<std::vector<std::uint8_t>> BlobRangeSource::next_block() {
    if (remaining_ == 0) {
        return Ok(std::vector<std::uint8_t>{});
    }

    const std::uint64_t want = std::min(remaining_, block_size_);
    auto data = blobs_.get_range(key_, offset_, want);
    if (data.is_error()) {
        return data;
    }
    if (data.value().size() != want) {
        return Err<std::vector<std::uint8_t>>(
            ErrorCode::StorageFailure,
            key_ + " is shorter than its catalog entry at offset " + std::to_string(offset_));
    }

    offset_ += want;
    remaining_ -= want;
    return data;
}

} // namespace rms::stream
