#pragma once

#include "rms/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rms::stream {

/// Inclusive byte interval [start, end] of a resource.
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }
};

/**
 * @brief Parse a single-range "Range" header against a resource size
 *
 * Accepted forms: "bytes=a-b", "bytes=a-" and "bytes=-n". An end past the
 * resource is clamped to the last byte. "bytes=a-" is capped to
 * open_range_cap bytes when the cap is non-zero.
 *
 * Returns std::nullopt for an absent header, and also for a header this
 * parser does not understand (other units, multiple ranges): such a request
 * is answered with the whole resource. A well-formed range that selects no
 * byte of the resource fails with RangeNotSatisfiable.
 */
Result<std::optional<ByteRange>> parse_range(const std::string& header,
                                             std::uint64_t total_size,
                                             std::uint64_t open_range_cap);

/// "bytes 0-1023/483822037"
std::string content_range(const ByteRange& range, std::uint64_t total_size);

/// "bytes */483822037", sent with 416.
std::string unsatisfied_content_range(std::uint64_t total_size);

/**
 * @brief Part of one chunk that a response body reads
 */
struct ChunkSlice {
    std::uint32_t chunk_index = 0;
    std::uint64_t offset = 0;   ///< Into the chunk
    std::uint64_t length = 0;
};

/**
 * @brief Map a file-level byte range onto chunk reads
 *
 * start_chunk = start / chunk_size and end_chunk = end / chunk_size; the
 * first slice begins at start % chunk_size, the last ends at end % chunk_size
 * and the chunks between are read whole. Arithmetic on the last chunk clamps
 * to its true length. Slices longer than max_block are split so no single
 * read exceeds it (0 = no split).
 */
std::vector<ChunkSlice> plan_slices(const ByteRange& range,
                                    std::uint64_t total_size,
                                    std::uint64_t chunk_size,
                                    std::uint64_t max_block);

/// Chunk indices [first, last] touched by a range.
std::pair<std::uint32_t, std::uint32_t> chunk_span(const ByteRange& range, std::uint64_t chunk_size);

} // namespace rms::stream
