#pragma once

#include "rms/core/result.hpp"
#include "rms/network/http_parser.hpp"
#include "rms/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace rms {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief One accepted connection, one request, one response
 *
 * Lifecycle:
 * 1. start() reads until the parser has a complete request
 * 2. The handler builds the response
 * 3. Head and in-memory body are written; a streamed body follows block by
 *    block, each block pulled only after the previous write completed
 * 4. The socket is shut down
 *
 * A body source failure after the head went out aborts the connection so
 * the client sees a short body instead of wrong bytes.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size);

    void start();

private:
    void do_read();
    void do_write(HttpResponse response);
    void write_next_block();
    void finish();
    void abort(const std::string& reason);

    void handle_error(const Error& error);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;

    std::shared_ptr<BodySource> body_source_;
    std::vector<uint8_t> pending_;           ///< Bytes of the write in flight
    std::string request_line_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Async accept on the given io_context. Running io_context::run() from
 * several threads serves connections in parallel; the handler may then be
 * invoked concurrently.
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context,
                   const std::string& bind_address,
                   uint16_t port,
                   size_t max_body_size = 96ULL * 1024 * 1024);

    void set_handler(HttpRequestHandler handler);

    /// Actual listening port, useful when constructed with port 0.
    uint16_t get_port() const;

    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    asio::io_context& io_context_;
    HttpRequestHandler handler_;
    size_t max_body_size_;
};

} // namespace network
} // namespace rms
