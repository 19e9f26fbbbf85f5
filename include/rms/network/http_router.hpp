#pragma once

#include "rms/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rms {
namespace network {

/**
 * @brief Request plus the parameters captured from the route pattern
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // ":token" -> value

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/// Returns false to short-circuit with the response it filled in.
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Pattern router
 *
 * Patterns use ":name" for one path segment and "*" for the rest of the
 * path. Matching is on the request path; the query string is ignored.
 * Routes are tried in registration order.
 *
 * A path that matches a route under another method yields 405. Handlers
 * that throw produce a 500 with a JSON error body.
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void head(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_matches_any(const std::string& path) const;
};

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// JSON error body {"error": message, "code": code_name}.
HttpResponse make_error_response(HttpStatus status, const std::string& message, const std::string& code);

/// HTTP status for an engine error code.
HttpStatus status_for(ErrorCode code);

/// Error response for an engine error; 503s carry Retry-After.
HttpResponse make_error_response(const Error& error);

} // namespace network
} // namespace rms
