#include "rms/network/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

namespace rms {
namespace network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr std::uint64_t kMaxResponseBody = 16ULL * 1024 * 1024;

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PUT: return http::verb::put;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
        case HttpMethod::HEAD: return http::verb::head;
        case HttpMethod::OPTIONS: return http::verb::options;
        default: return http::verb::unknown;
    }
}

} // namespace

HttpClient::HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host))
    , port_(port)
    , timeout_(timeout) {
}

Result<ClientResponse> HttpClient::send(const ClientRequest& request, CancellationToken* cancel) const {
    if (cancel != nullptr && cancel->is_cancelled()) {
        return Err<ClientResponse>(ErrorCode::Cancelled, "cancelled before sending " + request.target);
    }

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{to_verb(request.method), request.target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, "rms-upload");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBody);

    boost::system::error_code failure;
    bool cancelled = false;

    stream.expires_after(timeout_);
    resolver.async_resolve(
        host_, std::to_string(port_),
        [&](boost::system::error_code resolve_ec, tcp::resolver::results_type endpoints) {
            if (resolve_ec) {
                failure = resolve_ec;
                return;
            }
            stream.async_connect(endpoints, [&](boost::system::error_code connect_ec, const tcp::endpoint&) {
                if (connect_ec) {
                    failure = connect_ec;
                    return;
                }
                http::async_write(stream, req, [&](boost::system::error_code write_ec, std::size_t) {
                    if (write_ec) {
                        failure = write_ec;
                        return;
                    }
                    http::async_read(stream, buffer, parser, [&](boost::system::error_code read_ec, std::size_t) {
                        if (read_ec) {
                            failure = read_ec;
                        }
                    });
                });
            });
        });

    std::size_t callback_id = 0;
    if (cancel != nullptr) {
        callback_id = cancel->on_cancel([&]() {
            asio::post(ioc, [&]() {
                cancelled = true;
                resolver.cancel();
                stream.cancel();
            });
        });
    }

    ioc.run();

    if (cancel != nullptr) {
        cancel->remove_callback(callback_id);
    }

    if (cancelled) {
        return Err<ClientResponse>(ErrorCode::Cancelled, "request to " + request.target + " was cancelled");
    }
    if (failure) {
        const std::string reason = failure == beast::error::timeout ? "timed out" : failure.message();
        spdlog::debug("[HttpClient] {} {}:{}{} failed: {}",
                      HttpMethodUtils::to_string(request.method), host_, port_, request.target, reason);
        return Err<ClientResponse>(ErrorCode::TransportFailure,
                                   HttpMethodUtils::to_string(request.method) + " " + request.target + ": " + reason);
    }

    boost::system::error_code shutdown_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

    const auto& res = parser.get();
    ClientResponse response;
    response.status_code = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = res.body();
    return Ok(std::move(response));
}

} // namespace network
} // namespace rms
