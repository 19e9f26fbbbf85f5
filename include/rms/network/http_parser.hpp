#pragma once

#include "rms/core/result.hpp"
#include "rms/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace rms {
namespace network {

/**
 * @brief State machine states for HTTP request parsing
 *
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed it whatever the socket delivered; parse() reports true once the
 * request, body included, is complete. The request line and headers are
 * consumed byte by byte, the body is copied in bulk.
 *
 * Bodies larger than max_body_size fail with PayloadTooLarge as soon as the
 * Content-Length header is seen, before any body byte is buffered.
 */
class HttpParser {
public:
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(size_t max_body_size = 96ULL * 1024 * 1024)
        : max_body_size_(max_body_size) {
        reset();
    }

    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::BODY) {
                const size_t take = std::min(len - i, expected_body_ - request_.body.size());
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() >= expected_body_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request head too large");
            }
            if (c == '\n') {
                line_++;
            }

            switch (state_) {
                case ParseState::METHOD:
                    if (!parse_method(c)) {
                        return fail("Failed to parse HTTP method at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::URL:
                    if (!parse_url(c)) {
                        return fail("Failed to parse URL at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::VERSION:
                    if (!parse_version(c)) {
                        return fail("Failed to parse HTTP version at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::HEADER_NAME: {
                    auto res = parse_header_name(c);
                    if (res.is_error()) {
                        state_ = ParseState::PARSE_ERROR;
                        return Err<bool, Error>(res.error());
                    }
                    break;
                }

                case ParseState::HEADER_VALUE:
                    if (!parse_header_value(c)) {
                        return fail("Failed to parse header value at line " + std::to_string(line_));
                    }
                    break;

                case ParseState::BODY:
                    break;

                case ParseState::COMPLETE:
                    return Ok(true);

                case ParseState::PARSE_ERROR:
                    return fail("Parser in error state");
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /// Only meaningful once parse() returned true.
    HttpRequest& request() { return request_; }

    HttpRequest take_request() { return std::move(request_); }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t max_body_size_;
    size_t expected_body_ = 0;
    size_t header_bytes_ = 0;
    size_t line_ = 1;
    bool last_char_was_cr_ = false;

    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool>(ErrorCode::InvalidArgument, std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty() || buffer_.front() != '/') {
                return false;
            }
            request_.url = buffer_;
            split_target(request_.url, request_.path, request_.query);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    Result<void> parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return Ok();
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return Err<void>(ErrorCode::InvalidArgument, "Empty header name at line " + std::to_string(line_));
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return Ok();
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return Err<void>(ErrorCode::InvalidArgument, "Failed to parse header name at line " + std::to_string(line_));
        }

        buffer_ += c;
        return Ok();
    }

    Result<void> finish_headers() {
        if (!request_.get_header("Transfer-Encoding").empty()) {
            return Err<void>(ErrorCode::InvalidArgument, "Transfer-Encoding request bodies are not supported");
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return Ok();
        }

        char* end = nullptr;
        const unsigned long long body_length = std::strtoull(content_length.c_str(), &end, 10);
        if (end == content_length.c_str() || *end != '\0' || content_length.front() == '-') {
            return Err<void>(ErrorCode::InvalidArgument, "Invalid Content-Length: " + content_length);
        }
        if (body_length > max_body_size_) {
            return Err<void>(ErrorCode::PayloadTooLarge,
                             "Request body of " + content_length + " bytes exceeds " + std::to_string(max_body_size_));
        }

        expected_body_ = static_cast<size_t>(body_length);
        if (expected_body_ == 0) {
            state_ = ParseState::COMPLETE;
            return Ok();
        }
        request_.body.reserve(expected_body_);
        state_ = ParseState::BODY;
        return Ok();
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace rms
