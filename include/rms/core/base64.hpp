#pragma once

#include "rms/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rms {

std::string base64_encode(const std::vector<std::uint8_t>& data);

/**
 * @brief Decode standard base64 text
 *
 * Accepts an optional `data:<mime>;base64,` prefix as sent by browsers.
 * Malformed input fails with InvalidArgument.
 */
Result<std::vector<std::uint8_t>> base64_decode(const std::string& encoded);

/// Number of bytes base64_decode() would produce for well-formed input.
std::size_t base64_decoded_size(const std::string& encoded);

} // namespace rms
