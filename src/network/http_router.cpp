#include "ixcp/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace ixcp::network {

namespace {

HttpResponse json_error(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(nlohmann::json{{"error", message}}.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace

// ────────────────────────────────────────────────────────────
// Route
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, std::string p, RouteHandler h)
    : method(m), path(std::move(p)), handler(std::move(h)) {
}

// ────────────────────────────────────────────────────────────
// HttpRouter
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::GET, path, std::move(handler));
}

void HttpRouter::post(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::POST, path, std::move(handler));
}

void HttpRouter::delete_(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, path, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& path, RouteHandler handler) {
    routes_.emplace_back(method, path, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), path);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::add_response_filter(ResponseFilter filter) {
    filters_.push_back(std::move(filter));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpResponse response = dispatch(request);
    for (const auto& filter : filters_) {
        filter(request, response);
    }
    return response;
}

HttpResponse HttpRouter::dispatch(const HttpRequest& request) const {
    const std::string path = request.path();
    HttpContext ctx(request);

    // Preflight requests carry no credentials, so they bypass middleware.
    const Route* route = find_route(request.method, path);
    if (!route && request.method == HttpMethod::OPTIONS) {
        if (path == "*" || path_known(path)) {
            return HttpResponse(HttpStatus::NO_CONTENT);
        }
        return not_found_handler_(ctx);
    }

    HttpResponse response(HttpStatus::OK);
    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    if (!route) {
        if (path_known(path)) {
            return json_error(HttpStatus::METHOD_NOT_ALLOWED,
                              HttpMethodUtils::to_string(request.method) + " not allowed on " + path);
        }
        return not_found_handler_(ctx);
    }

    try {
        return route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} {} threw: {}",
                      HttpMethodUtils::to_string(request.method), path, e.what());
        return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.path;
        route_list.push_back(oss.str());
    }
    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return json_error(HttpStatus::NOT_FOUND, "No route for " + ctx.request.path());
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

bool HttpRouter::path_known(const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.path == path) {
            return true;
        }
    }
    return false;
}

} // namespace ixcp::network
