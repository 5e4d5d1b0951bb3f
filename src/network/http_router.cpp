#include "dsup/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <limits>

namespace dsup {
namespace network {

namespace {

HttpResponse json_error(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(nlohmann::json{{"error", message}}.dump());
    return response;
}

} // namespace

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return segments;
}

std::string path_of(const std::string& url) {
    const auto query = url.find('?');
    return query == std::string::npos ? url : url.substr(0, query);
}

// ────────────────────────────────────────────────────────────
// HttpContext
// ────────────────────────────────────────────────────────────

std::string HttpContext::get_param(const std::string& name, const std::string& default_value) const {
    auto it = params.find(name);
    return (it != params.end()) ? it->second : default_value;
}

std::optional<std::uint64_t> HttpContext::number_param(const std::string& name) const {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }

    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (const char c : it->second) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    for (auto& part : split_path(pattern)) {
        if (part.size() > 1 && part.front() == ':') {
            segments.push_back(PathSegment{part.substr(1), true});
        } else {
            segments.push_back(PathSegment{std::move(part), false});
        }
    }
}

bool Route::match_path(const std::vector<std::string>& path_segments,
                       std::unordered_map<std::string, std::string>& params) const {
    if (path_segments.size() != segments.size()) {
        return false;
    }

    std::unordered_map<std::string, std::string> captured;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].is_param) {
            captured[segments[i].text] = path_segments[i];
        } else if (segments[i].text != path_segments[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_([](const HttpContext& ctx) {
          return json_error(HttpStatus::NOT_FOUND, "no route for " + path_of(ctx.request.url));
      }) {
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

void HttpRouter::patch(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PATCH, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Route {} {} ({} segments)", HttpMethodUtils::to_string(method), pattern,
                  routes_.back().segments.size());
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

    const auto path_segments = split_path(path_of(request.url));
    const Route* selected = nullptr;
    for (const auto& route : routes_) {
        if (route.method == request.method && route.match_path(path_segments, ctx.params)) {
            selected = &route;
            break;
        }
    }

    if (!selected) {
        auto rejected = method_not_allowed(path_segments);
        return rejected.status_code == static_cast<int>(HttpStatus::METHOD_NOT_ALLOWED)
                   ? rejected
                   : not_found_handler_(ctx);
    }

    try {
        return selected->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", HttpMethodUtils::to_string(request.method), selected->pattern,
                      e.what());
        return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "internal server error");
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    route_list.reserve(routes_.size());
    for (const auto& route : routes_) {
        route_list.push_back(HttpMethodUtils::to_string(route.method) + " " + route.pattern);
    }
    return route_list;
}

HttpResponse HttpRouter::method_not_allowed(const std::vector<std::string>& path_segments) const {
    std::string allow;
    std::unordered_map<std::string, std::string> ignored;
    for (const auto& route : routes_) {
        if (!route.match_path(path_segments, ignored)) {
            continue;
        }
        const auto name = HttpMethodUtils::to_string(route.method);
        if (allow.find(name) == std::string::npos) {
            allow += allow.empty() ? name : ", " + name;
        }
    }

    if (allow.empty()) {
        return HttpResponse(HttpStatus::NOT_FOUND);
    }
    auto response = json_error(HttpStatus::METHOD_NOT_ALLOWED, "method not allowed");
    response.set_header("Allow", allow);
    return response;
}

} // namespace network
} // namespace dsup
