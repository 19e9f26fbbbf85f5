#include "rms/network/http_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using rms::ErrorCode;
using rms::network::HttpMethod;
using rms::network::HttpParser;
using rms::network::HttpVersion;

namespace {

rms::Result<bool> feed(HttpParser& parser, const std::string& text) {
    return parser.parse(text.data(), text.size());
}

} // namespace

TEST(HttpParserTest, ParsesRequestWithoutBody) {
    HttpParser parser;
    auto result = feed(parser,
                       "GET /files/stream/abc?download=1&name=a%20b HTTP/1.1\r\n"
                       "Host: localhost\r\n"
                       "Range: bytes=0-1023\r\n"
                       "\r\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    const auto& request = parser.request();
    EXPECT_EQ(request.method, HttpMethod::GET);
    EXPECT_EQ(request.version, HttpVersion::HTTP_1_1);
    EXPECT_EQ(request.path, "/files/stream/abc");
    EXPECT_EQ(request.get_query("download"), "1");
    EXPECT_EQ(request.get_query("name"), "a b");
    EXPECT_EQ(request.get_header("range"), "bytes=0-1023");
    EXPECT_TRUE(request.body.empty());
}

TEST(HttpParserTest, BodyArrivesInPieces) {
    HttpParser parser;
    auto head = feed(parser,
                     "PUT /api/uploads/tok/chunks/3 HTTP/1.1\r\n"
                     "Content-Length: 10\r\n"
                     "X-User-Id: alice\r\n"
                     "\r\n"
                     "01234");
    ASSERT_TRUE(head.is_ok());
    EXPECT_FALSE(head.value());

    auto rest = feed(parser, "56789");
    ASSERT_TRUE(rest.is_ok());
    EXPECT_TRUE(rest.value());
    EXPECT_EQ(parser.request().body_as_string(), "0123456789");
    EXPECT_EQ(parser.request().get_header("X-User-Id"), "alice");
}

TEST(HttpParserTest, ByteAtATime) {
    const std::string text = "POST /api/uploads HTTP/1.0\r\nContent-Length: 2\r\n\r\n{}";
    HttpParser parser;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        auto step = parser.parse(&text[i], 1);
        ASSERT_TRUE(step.is_ok());
        EXPECT_FALSE(step.value());
    }
    auto last = parser.parse(&text.back(), 1);
    ASSERT_TRUE(last.is_ok());
    EXPECT_TRUE(last.value());
    EXPECT_EQ(parser.request().version, HttpVersion::HTTP_1_0);
    EXPECT_EQ(parser.request().body_as_string(), "{}");
}

TEST(HttpParserTest, OversizedBodyRejectedBeforeReading) {
    HttpParser parser(16);
    auto result = feed(parser, "PUT /x HTTP/1.1\r\nContent-Length: 17\r\n\r\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);
}

TEST(HttpParserTest, RejectsMalformedRequests) {
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "get / HTTP/1.1\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "BREW / HTTP/1.1\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "GET / HTTP/2.0\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "GET / HTTP/1.1\r\nContent-Length: -4\r\n\r\n").is_error());
    }
    {
        HttpParser parser;
        EXPECT_TRUE(feed(parser, "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n").is_error());
    }
}

TEST(HttpParserTest, ResetAllowsNextRequest) {
    HttpParser parser;
    ASSERT_TRUE(feed(parser, "GET /a HTTP/1.1\r\n\r\n").value());
    parser.reset();
    ASSERT_TRUE(feed(parser, "HEAD /b HTTP/1.1\r\n\r\n").value());
    EXPECT_EQ(parser.request().method, HttpMethod::HEAD);
    EXPECT_EQ(parser.request().path, "/b");
}
