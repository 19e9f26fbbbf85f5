#pragma once

#include "rms/core/result.hpp"

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace rms {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    PARTIAL_CONTENT = 206,
    FOUND = 302,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    GONE = 410,
    PAYLOAD_TOO_LARGE = 413,
    RANGE_NOT_SATISFIABLE = 416,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief Parsed HTTP request
 *
 * url is the raw request target; path and query are split from it by the
 * parser. Query values are percent-decoded.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    std::string path;
    std::unordered_map<std::string, std::string> query;
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /// Case-insensitive lookup; empty string when absent.
    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return it != query.end() ? it->second : default_value;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Pull-based producer of a response body
 *
 * The connection asks for the next block only after the previous one has
 * been written, so a slow client throttles the reads behind it. An empty
 * block ends the body.
 */
class BodySource {
public:
    virtual ~BodySource() = default;

    virtual Result<std::vector<uint8_t>> next_block() = 0;

    /// Bytes still to be produced.
    [[nodiscard]] virtual uint64_t remaining() const noexcept = 0;
};

/**
 * @brief HTTP response
 *
 * Either carries its body in memory or, for large payloads, a BodySource
 * that the connection drains block by block. In the streamed case
 * Content-Length is set by whoever attaches the source.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::shared_ptr<BodySource> body_source;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body_source(std::shared_ptr<BodySource> source, uint64_t content_length) {
        body.clear();
        body_source = std::move(source);
        headers["Content-Length"] = std::to_string(content_length);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    [[nodiscard]] bool is_streamed() const noexcept { return body_source != nullptr; }

    /// Status line and headers, terminated by the blank line.
    std::vector<uint8_t> serialize_head() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";
        const std::string head = oss.str();
        return std::vector<uint8_t>(head.begin(), head.end());
    }

    /// Head plus in-memory body. A streamed body is not included.
    std::vector<uint8_t> serialize() const {
        auto result = serialize_head();
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::CREATED: return "Created";
            case HttpStatus::NO_CONTENT: return "No Content";
            case HttpStatus::PARTIAL_CONTENT: return "Partial Content";
            case HttpStatus::FOUND: return "Found";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::UNAUTHORIZED: return "Unauthorized";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::CONFLICT: return "Conflict";
            case HttpStatus::GONE: return "Gone";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::RANGE_NOT_SATISFIABLE: return "Range Not Satisfiable";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

/// Decode %XX escapes and '+' (as space when plus_as_space is set).
std::string url_decode(const std::string& text, bool plus_as_space = true);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string url_encode(const std::string& text);

/// Split "path?a=1&b=2" into path and decoded query parameters.
void split_target(const std::string& target,
                  std::string& path,
                  std::unordered_map<std::string, std::string>& query);

} // namespace network
} // namespace rms
