#include "rms/network/http_server_asio.hpp"

#include "rms/network/http_router.hpp"

#include <spdlog/spdlog.h>

namespace rms {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, size_t max_body_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(max_body_size) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error());
                return;
            }
            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.take_request();
            request_line_ = HttpMethodUtils::to_string(request.method) + " " + request.path;

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                               "Internal server error", "StorageFailure");
            }

            spdlog::info("{} -> {}", request_line_, response.status_code);
            if (request.method == HttpMethod::HEAD) {
                response.body.clear();
                response.body_source.reset();
            }
            do_write(std::move(response));
        }
    );
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();

    response.set_header("Connection", "close");
    body_source_ = std::move(response.body_source);
    pending_ = response.serialize();

    asio::async_write(
        socket_,
        asio::buffer(pending_),
        [this, self](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            if (body_source_) {
                write_next_block();
            } else {
                finish();
            }
        }
    );
}

void HttpConnection::write_next_block() {
    auto block = body_source_->next_block();
    if (block.is_error()) {
        abort("body source failed: " + block.error().message);
        return;
    }
    if (block.value().empty()) {
        if (body_source_->remaining() > 0) {
            abort("body source ended early");
            return;
        }
        finish();
        return;
    }

    pending_ = std::move(block.value());
    auto self = shared_from_this();
    asio::async_write(
        socket_,
        asio::buffer(pending_),
        [this, self](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Client went away during {}: {}", request_line_, ec.message());
                }
                return;
            }
            write_next_block();
        }
    );
}

void HttpConnection::finish() {
    boost::system::error_code shutdown_ec;
    socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
}

void HttpConnection::abort(const std::string& reason) {
    spdlog::error("Aborting {}: {}", request_line_, reason);
    boost::system::error_code close_ec;
    socket_.close(close_ec);
}

void HttpConnection::handle_error(const Error& error) {
    spdlog::warn("Connection error: {}", error.message);
    do_write(make_error_response(error));
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               const std::string& bind_address,
                               uint16_t port,
                               size_t max_body_size)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(bind_address), port))
    , io_context_(io_context)
    , max_body_size_(max_body_size) {

    spdlog::info("HTTP server listening on {}:{}", bind_address, get_port());
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

uint16_t HttpServerAsio::get_port() const {
    boost::system::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted) {
                    return;
                }
                spdlog::error("Accept error: {}", ec.message());
            } else {
                std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_size_)->start();
            }
            do_accept();
        }
    );
}

} // namespace network
} // namespace rms
