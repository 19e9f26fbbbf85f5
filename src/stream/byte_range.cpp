#include "rms/stream/byte_range.hpp"

#include "rms/upload/types.hpp"

#include <algorithm>
#include <cctype>

namespace rms::stream {

namespace {

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    out = value;
    return true;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

Result<std::optional<ByteRange>> unsatisfiable(const std::string& header, std::uint64_t total_size) {
    return Err<std::optional<ByteRange>>(
        ErrorCode::RangeNotSatisfiable,
        "Range '" + header + "' not satisfiable for " + std::to_string(total_size) + " bytes");
}

} // namespace

Result<std::optional<ByteRange>> parse_range(const std::string& header,
                                             std::uint64_t total_size,
                                             std::uint64_t open_range_cap) {
    const std::string value = trim(header);
    if (value.empty()) {
        return Ok(std::optional<ByteRange>{});
    }

    static const std::string kPrefix = "bytes=";
    if (value.compare(0, kPrefix.size(), kPrefix) != 0 || value.find(',') != std::string::npos) {
        return Ok(std::optional<ByteRange>{});
    }

    const std::string range_spec = trim(value.substr(kPrefix.size()));
    const auto dash = range_spec.find('-');
    if (dash == std::string::npos) {
        return Ok(std::optional<ByteRange>{});
    }
    const std::string first = trim(range_spec.substr(0, dash));
    const std::string last = trim(range_spec.substr(dash + 1));

    // Suffix form: the final n bytes
    if (first.empty()) {
        std::uint64_t suffix = 0;
        if (!parse_number(last, suffix)) {
            return Ok(std::optional<ByteRange>{});
        }
        if (suffix == 0 || total_size == 0) {
            return unsatisfiable(header, total_size);
        }
        suffix = std::min(suffix, total_size);
        return Ok(std::optional<ByteRange>(ByteRange{total_size - suffix, total_size - 1}));
    }

    std::uint64_t start = 0;
    if (!parse_number(first, start)) {
        return Ok(std::optional<ByteRange>{});
    }

    std::uint64_t end = 0;
    if (last.empty()) {
        if (start >= total_size) {
            return unsatisfiable(header, total_size);
        }
        end = total_size - 1;
        if (open_range_cap > 0 && end - start + 1 > open_range_cap) {
            end = start + open_range_cap - 1;
        }
        return Ok(std::optional<ByteRange>(ByteRange{start, end}));
    }

    if (!parse_number(last, end) || end < start) {
        return Ok(std::optional<ByteRange>{});
    }
    if (start >= total_size) {
        return unsatisfiable(header, total_size);
    }
    end = std::min(end, total_size - 1);
    return Ok(std::optional<ByteRange>(ByteRange{start, end}));
}

std::string content_range(const ByteRange& range, std::uint64_t total_size) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) +
           "/" + std::to_string(total_size);
}

std::string unsatisfied_content_range(std::uint64_t total_size) {
    return "bytes */" + std::to_string(total_size);
}

std::pair<std::uint32_t, std::uint32_t> chunk_span(const ByteRange& range, std::uint64_t chunk_size) {
    return {static_cast<std::uint32_t>(range.start / chunk_size),
            static_cast<std::uint32_t>(range.end / chunk_size)};
}

std::vector<ChunkSlice> plan_slices(const ByteRange& range,
                                    std::uint64_t total_size,
                                    std::uint64_t chunk_size,
                                    std::uint64_t max_block) {
    std::vector<ChunkSlice> slices;
    if (chunk_size == 0 || total_size == 0 || range.start > range.end || range.start >= total_size) {
        return slices;
    }

    const std::uint64_t end = std::min(range.end, total_size - 1);
    const auto [start_chunk, end_chunk] = chunk_span(ByteRange{range.start, end}, chunk_size);

    for (std::uint32_t index = start_chunk; index <= end_chunk; ++index) {
        const std::uint64_t this_chunk = upload::chunk_length(total_size, chunk_size, index);
        const std::uint64_t from = (index == start_chunk) ? range.start % chunk_size : 0;
        const std::uint64_t to = (index == end_chunk)
            ? std::min(end % chunk_size, this_chunk - 1)
            : this_chunk - 1;

        std::uint64_t offset = from;
        while (offset <= to) {
            std::uint64_t length = to - offset + 1;
            if (max_block > 0) {
                length = std::min(length, max_block);
            }
            slices.push_back(ChunkSlice{index, offset, length});
            offset += length;
        }
    }
    return slices;
}

} // namespace rms::stream
