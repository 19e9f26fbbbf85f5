#pragma once

#include <cstddef>
#include <string>

namespace rms {

/// Random lowercase hex identifier of 2 * random_bytes characters.
std::string generate_token(std::size_t random_bytes = 16);

/// "<prefix>-<random hex>", used for file ids.
std::string generate_id(const std::string& prefix);

} // namespace rms
