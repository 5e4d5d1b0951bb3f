#pragma once

#include "dsup/network/http_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsup {
namespace network {

/**
 * @brief Request plus the parameters captured from the route pattern
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // ":id" -> "42"

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const;

    /// Decimal value of a captured segment; nullopt when absent, signed or out of range
    std::optional<std::uint64_t> number_param(const std::string& name) const;
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before routing; return false to answer with `response` directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

/**
 * @brief One path segment of a compiled route pattern
 */
struct PathSegment {
    std::string text;      // literal text, or the parameter name when is_param
    bool is_param = false;
};

struct Route {
    HttpMethod method;
    std::string pattern;                   // e.g. "/source/:id/chunk/:seq_num/:byte_offset"
    std::vector<PathSegment> segments;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    /// Captures parameters into `params` when every segment lines up
    bool match_path(const std::vector<std::string>& path_segments,
                    std::unordered_map<std::string, std::string>& params) const;
};

/**
 * @brief Method + path pattern dispatch with middleware
 *
 * Patterns use ":name" for one path segment. The query string is ignored
 * when matching and routes are tried in registration order. A path that
 * exists under a different method answers 405 with an Allow header.
 *
 * Example:
 * ```cpp
 * HttpRouter router;
 * router.get("/source/:id", [](const HttpContext& ctx) { ... ctx.number_param("id") ... });
 * server.set_handler([&router](const HttpRequest& r) { return router.handle_request(r); });
 * ```
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
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

    HttpResponse method_not_allowed(const std::vector<std::string>& path_segments) const;
};

/**
 * @brief Split a path on '/', dropping empty segments
 *
 * "/source/7/" and "source/7" both yield {"source", "7"}.
 */
std::vector<std::string> split_path(const std::string& path);

/**
 * @brief Strip the query string from a request target
 */
std::string path_of(const std::string& url);

} // namespace network
} // namespace dsup
