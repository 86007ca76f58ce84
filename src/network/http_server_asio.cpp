#include "ixcp/network/http_server_asio.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ixcp::network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket,
                               HttpRequestHandler handler,
                               std::chrono::milliseconds idle_timeout,
                               std::size_t max_body_bytes)
    : socket_(std::move(socket))
    , timer_(socket_.get_executor())
    , handler_(std::move(handler))
    , parser_(max_body_bytes)
    , idle_timeout_(idle_timeout) {
}

void HttpConnection::start() {
    arm_timer();
    do_read();
}

void HttpConnection::arm_timer() {
    auto self = shared_from_this();
    timer_.expires_after(idle_timeout_);
    timer_.async_wait([this, self](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        spdlog::debug("Closing idle connection");
        close();
    });
}

void HttpConnection::close() {
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                timer_.cancel();
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(HttpStatus::BAD_REQUEST, parse_result.error().message);
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            timer_.cancel();
            const HttpRequest& request = parser_.get_request();
            spdlog::debug("{} {} HTTP/{}",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0");

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR,
                                                 "Internal server error");
            }

            do_write(response);
        }
    );
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    if (!find_header(outgoing.headers, "Content-Length")) {
        outgoing.set_header("Content-Length", std::to_string(outgoing.body.size()));
    }
    outgoing.set_header("Connection", "close");

    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
            close();
        }
    );
}

void HttpConnection::handle_error(HttpStatus status, const std::string& message) {
    timer_.cancel();
    spdlog::warn("Rejecting malformed request: {}", message);
    do_write(create_error_response(status, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(nlohmann::json{{"error", message}}.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on port {}", port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Closing acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                spdlog::debug("Accepted new connection");
                std::make_shared<HttpConnection>(
                    std::move(socket), handler_, idle_timeout_, max_body_bytes_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

} // namespace ixcp::network
