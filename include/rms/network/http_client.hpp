#pragma once

#include "rms/core/cancellation.hpp"
#include "rms/core/result.hpp"
#include "rms/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace rms {
namespace network {

struct ClientRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;                          ///< "/api/uploads/abc?x=1"
    std::map<std::string, std::string> headers;
    std::string body;
};

struct ClientResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Blocking HTTP/1.1 client, one connection per request
 *
 * Every call runs its own io_context, so concurrent calls from different
 * threads share nothing. The whole exchange (connect, write, read) is bounded
 * by the request timeout. A cancellation token aborts the exchange in
 * flight from any thread; the call then fails with Cancelled.
 *
 * Only connection-level problems are errors here. Any HTTP status, 5xx
 * included, is a successful ClientResponse.
 */
class HttpClient {
public:
    HttpClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout);

    Result<ClientResponse> send(const ClientRequest& request,
                                CancellationToken* cancel = nullptr) const;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace rms
