#include "rms/network/http_types.hpp"

#include <cctype>

namespace rms {
namespace network {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_decode(const std::string& text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += (plus_as_space && c == '+') ? ' ' : c;
    }
    return out;
}

std::string url_encode(const std::string& text) {
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0f];
        }
    }
    return out;
}

void split_target(const std::string& target,
                  std::string& path,
                  std::unordered_map<std::string, std::string>& query) {
    const auto question = target.find('?');
    path = target.substr(0, question);
    query.clear();
    if (question == std::string::npos) {
        return;
    }

    const std::string query_string = target.substr(question + 1);
    size_t start = 0;
    while (start <= query_string.size()) {
        auto end = query_string.find('&', start);
        if (end == std::string::npos) {
            end = query_string.size();
        }
        const std::string pair = query_string.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                query[url_decode(pair)] = "";
            } else {
                query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
}

} // namespace network
} // namespace rms
