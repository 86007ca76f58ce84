#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ixcp::network {

/**
 * @brief Parsed "http://host[:port][/base]" address
 */
struct ServerAddress {
    std::string host;
    std::uint16_t port = 80;
    std::string base_path;  // without trailing '/', may be empty

    static Result<ServerAddress> parse(const std::string& url);
    std::string host_header() const;
};

/**
 * @brief Blocking HTTP/1.1 client on Boost.Asio
 *
 * Every request opens its own connection and io_context, so one client may
 * be used from several threads at once. The timeout covers the whole
 * exchange (resolve, connect, write, read).
 *
 * Transport-level failures (resolve, connect, reset, timeout, truncated
 * response) come back as TransientTransport. Any complete response,
 * whatever its status, is returned as a success for the caller to map.
 */
class HttpClient {
public:
    HttpClient(ServerAddress address, std::chrono::milliseconds timeout);

    static Result<HttpClient> create(const std::string& base_url, std::chrono::milliseconds timeout);

    /// @p request.url is relative to the base path ("/upload/status?filename=x").
    Result<HttpResponse> send(HttpRequest request) const;

    const ServerAddress& address() const { return address_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    ServerAddress address_;
    std::chrono::milliseconds timeout_;
};

} // namespace ixcp::network
