#include "rms/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace rms {
namespace network {

// ────────────────────────────────────────────────────────────
// Helper: Convert URL pattern to regex
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }
            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            const char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

HttpResponse make_error_response(HttpStatus status, const std::string& message, const std::string& code) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    const nlohmann::json body{{"error", message}, {"code", code}};
    response.set_body(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return response;
}

HttpStatus status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidSize:
        case ErrorCode::InvalidArgument:
        case ErrorCode::IndexOutOfRange:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::Unauthorized:
            return HttpStatus::UNAUTHORIZED;
        case ErrorCode::SessionNotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorCode::SessionTerminal:
        case ErrorCode::Conflict:
        case ErrorCode::IncompleteUpload:
        case ErrorCode::Cancelled:
            return HttpStatus::CONFLICT;
        case ErrorCode::SessionExpired:
            return HttpStatus::GONE;
        case ErrorCode::PayloadTooLarge:
            return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::RangeNotSatisfiable:
            return HttpStatus::RANGE_NOT_SATISFIABLE;
        case ErrorCode::NotYetAvailable:
            return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorCode::StorageFailure:
        case ErrorCode::TransportFailure:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_error_response(const Error& error) {
    auto response = make_error_response(status_for(error.code), error.message, to_string(error.code));
    if (error.code == ErrorCode::NotYetAvailable) {
        response.set_header("Retry-After", "5");
    }
    return response;
}

// ────────────────────────────────────────────────────────────
// Route Implementation
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    regex = std::regex(pattern_to_regex(pattern, param_names));
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    return method == req_method && std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;
    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }
    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter Implementation
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::head(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::HEAD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const Route* route = find_route(request.method, request.path);
    if (!route) {
        if (path_matches_any(request.path)) {
            return make_error_response(HttpStatus::METHOD_NOT_ALLOWED,
                                       "Method not allowed for " + request.path, "MethodNotAllowed");
        }
        return not_found_handler_(ctx);
    }

    ctx.params = route->extract_params(request.path);
    for (auto& [name, value] : ctx.params) {
        value = url_decode(value, false);
    }

    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} {} threw: {}",
                      HttpMethodUtils::to_string(request.method), request.path, e.what());
        response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal Server Error", "StorageFailure");
    }
    return response;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        route_list.push_back(oss.str());
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return make_error_response(HttpStatus::NOT_FOUND, "No route for " + ctx.request.path, "NotFound");
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_matches_any(const std::string& path) const {
    for (const auto& route : routes_) {
        if (std::regex_match(path, route.regex)) {
            return true;
        }
    }
    return false;
}

} // namespace network
} // namespace rms
