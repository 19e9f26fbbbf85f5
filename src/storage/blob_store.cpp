#include "rms/storage/blob_store.hpp"

#include <algorithm>
#include <sstream>

namespace rms::storage {

Result<std::vector<std::uint8_t>> BlobStore::get_range(const std::string& key,
                                                       std::uint64_t offset,
                                                       std::uint64_t length) const {
    auto whole = get(key);
    if (whole.is_error()) {
        return whole;
    }
    auto& bytes = whole.value();
    if (offset >= bytes.size()) {
        return Ok(std::vector<std::uint8_t>{});
    }
    const auto end = std::min<std::uint64_t>(bytes.size(), offset + length);
    return Ok(std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                        bytes.begin() + static_cast<std::ptrdiff_t>(end)));
}

bool is_valid_key(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.back() == '/') {
        return false;
    }
    std::istringstream segments(key);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        if (segment.find('\\') != std::string::npos || segment.find('\0') != std::string::npos) {
            return false;
        }
    }
    return true;
}

} // namespace rms::storage
