#include "rms/core/base64.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <cctype>

namespace rms {
namespace {

namespace it = boost::archive::iterators;

using Encoder = it::base64_from_binary<
    it::transform_width<std::vector<std::uint8_t>::const_iterator, 6, 8>>;
using Decoder = it::transform_width<
    it::binary_from_base64<std::string::const_iterator>, 8, 6>;

std::string strip_data_url(const std::string& encoded) {
    if (encoded.compare(0, 5, "data:") == 0) {
        const auto comma = encoded.find(',');
        if (comma != std::string::npos) {
            return encoded.substr(comma + 1);
        }
    }
    return encoded;
}

std::string compact(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += c;
        }
    }
    return out;
}

std::size_t padding_of(const std::string& text) {
    std::size_t pad = 0;
    for (auto rit = text.rbegin(); rit != text.rend() && *rit == '=' && pad < 2; ++rit) {
        ++pad;
    }
    return pad;
}

} // namespace

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    std::string out(Encoder(data.begin()), Encoder(data.end()));
    out.append((3 - data.size() % 3) % 3, '=');
    return out;
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string& encoded) {
    std::string text = compact(strip_data_url(encoded));
    if (text.empty()) {
        return Ok(std::vector<std::uint8_t>{});
    }
    if (text.size() % 4 != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument,
                                              "base64 length is not a multiple of 4");
    }

    const std::size_t pad = padding_of(text);
    std::replace(text.end() - static_cast<std::ptrdiff_t>(pad), text.end(), '=', 'A');

    try {
        std::vector<std::uint8_t> out(Decoder(text.cbegin()), Decoder(text.cend()));
        out.resize(out.size() - pad);
        return Ok(std::move(out));
    } catch (const it::dataflow_exception& e) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::InvalidArgument,
                                              std::string("Invalid base64 payload: ") + e.what());
    }
}

std::size_t base64_decoded_size(const std::string& encoded) {
    const std::string text = compact(strip_data_url(encoded));
    if (text.size() % 4 != 0) {
        return 0;
    }
    return text.size() / 4 * 3 - padding_of(text);
}

} // namespace rms
