#pragma once

#include "ixcp/network/http_types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ixcp::network {

/**
 * @brief Request context passed to route handlers
 */
struct HttpContext {
    const HttpRequest& request;

    explicit HttpContext(const HttpRequest& req) : request(req) {}
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before routing; return false to answer with @p response directly
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

/**
 * @brief Hook applied to every outgoing response (CORS headers and the like)
 */
using ResponseFilter = std::function<void(const HttpRequest&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string path;
    RouteHandler handler;

    Route(HttpMethod m, std::string p, RouteHandler h);

    bool matches(HttpMethod req_method, const std::string& req_path) const {
        return method == req_method && path == req_path;
    }
};

/**
 * @brief Method + path router
 *
 * Routes match the exact request path; query strings are left to the
 * handler (HttpRequest::query_param). Routes are tried in registration
 * order. A path that matches some route under a different method yields
 * 405; OPTIONS on a known path yields 204 unless a route claims it.
 *
 * EXAMPLE:
 * ```cpp
 * HttpRouter router;
 * router.get("/upload/status", [](const HttpContext& ctx) { ... });
 * router.use(require_bearer_token);
 * HttpResponse res = router.handle_request(request);
 * ```
 *
 * Not thread-safe for registration; handle_request() may run concurrently
 * once all routes are registered.
 */
class HttpRouter {
public:
    HttpRouter();

    // ────────────────────────────────────────────────────────────
    // Route Registration
    // ────────────────────────────────────────────────────────────

    void get(const std::string& path, RouteHandler handler);
    void post(const std::string& path, RouteHandler handler);
    void delete_(const std::string& path, RouteHandler handler);
    void add_route(HttpMethod method, const std::string& path, RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Middleware
    // ────────────────────────────────────────────────────────────

    void use(Middleware middleware);
    void add_response_filter(ResponseFilter filter);

    void set_not_found_handler(RouteHandler handler);

    // ────────────────────────────────────────────────────────────
    // Request Handling
    // ────────────────────────────────────────────────────────────

    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    HttpResponse dispatch(const HttpRequest& request) const;
    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    std::vector<ResponseFilter> filters_;
    RouteHandler not_found_handler_;
};

} // namespace ixcp::network
