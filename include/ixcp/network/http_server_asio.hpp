#pragma once

#include "ixcp/network/http_parser.hpp"
#include "ixcp/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <memory>

namespace ixcp::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() arms the idle timer and begins reading
 * 3. One request is parsed, handled and answered
 * 4. The socket is shut down; the object dies with its last handler
 *
 * A connection that does not deliver a full request before the idle
 * timeout is closed.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   HttpRequestHandler handler,
                   std::chrono::milliseconds idle_timeout,
                   std::size_t max_body_bytes);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(HttpStatus status, const std::string& message);
    void arm_timer();
    void close();

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    asio::steady_timer timer_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::chrono::milliseconds idle_timeout_;
    std::array<char, 16384> buffer_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Architecture:
 * - Async accept: non-blocking connection acceptance
 * - Event loop (io_context): epoll/kqueue/IOCP notification
 * - Per-connection objects: each connection owns its async I/O state
 *
 * Thread safety:
 * - Handler may be called from any thread running the io_context
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 3000);
 * server.set_handler([&router](const HttpRequest& req) {
 *     return router.handle_request(req);
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    static constexpr std::chrono::milliseconds kDefaultIdleTimeout{30000};

    /**
     * @param io_context Boost.Asio event loop (must outlive this server)
     * @param port Port to listen on; 0 picks an ephemeral port
     *
     * Throws boost::system::system_error if the port cannot be bound.
     */
    HttpServerAsio(asio::io_context& io_context, uint16_t port);

    void set_handler(HttpRequestHandler handler);
    void set_idle_timeout(std::chrono::milliseconds timeout) { idle_timeout_ = timeout; }
    void set_max_body_bytes(std::size_t bytes) { max_body_bytes_ = bytes; }

    /// Actual listening port (resolved when 0 was requested).
    uint16_t get_port() const { return port_; }

    /// Stops accepting; connections in flight finish on their own.
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::chrono::milliseconds idle_timeout_ = kDefaultIdleTimeout;
    std::size_t max_body_bytes_ = HttpMessageParser::kDefaultMaxBodyBytes;
    uint16_t port_;
};

} // namespace ixcp::network
