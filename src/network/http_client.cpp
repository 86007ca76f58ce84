#include "ixcp/network/http_client.hpp"

#include "ixcp/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <memory>

namespace ixcp::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

/**
 * One request/response exchange driven by a private io_context.
 * The handlers chain resolve → connect → write → read until the response
 * parser completes or the peer closes.
 */
class Exchange {
public:
    Exchange(asio::io_context& io, const ServerAddress& address, std::vector<uint8_t> wire)
        : address_(address)
        , resolver_(io)
        , socket_(io)
        , wire_(std::move(wire)) {}

    void start() {
        resolver_.async_resolve(
            address_.host, std::to_string(address_.port),
            [this](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
                if (ec) {
                    return fail("resolve " + address_.host + ": " + ec.message());
                }
                asio::async_connect(socket_, endpoints,
                    [this](boost::system::error_code ec, const tcp::endpoint&) {
                        if (ec) {
                            return fail("connect: " + ec.message());
                        }
                        do_write();
                    });
            });
    }

    void abort() {
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.close(ignored);
    }

    bool done() const { return done_; }
    const Error& error() const { return error_; }
    bool failed() const { return failed_; }
    const HttpResponse& response() const { return parser_.get_response(); }

private:
    void do_write() {
        asio::async_write(socket_, asio::buffer(wire_),
            [this](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    return fail("write: " + ec.message());
                }
                do_read();
            });
    }

    void do_read() {
        socket_.async_read_some(asio::buffer(buffer_),
            [this](boost::system::error_code ec, std::size_t n) {
                if (ec == asio::error::eof) {
                    auto finished = parser_.finish();
                    if (finished.is_error()) {
                        return fail(finished.error().message);
                    }
                    return complete();
                }
                if (ec) {
                    return fail("read: " + ec.message());
                }
                auto parsed = parser_.parse(buffer_.data(), n);
                if (parsed.is_error()) {
                    error_ = parsed.error();
                    failed_ = true;
                    done_ = true;
                    abort();
                    return;
                }
                if (parsed.value()) {
                    return complete();
                }
                do_read();
            });
    }

    void complete() {
        done_ = true;
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    void fail(const std::string& message) {
        error_ = Error(ErrorCode::TransientTransport, message);
        failed_ = true;
        done_ = true;
        abort();
    }

    const ServerAddress& address_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    std::vector<uint8_t> wire_;
    std::array<char, 16384> buffer_{};
    HttpResponseParser parser_;
    Error error_;
    bool done_ = false;
    bool failed_ = false;
};

} // namespace

// ──────────────────────────────────────────────────────────
// ServerAddress
// ──────────────────────────────────────────────────────────

Result<ServerAddress> ServerAddress::parse(const std::string& url) {
    static const std::string kScheme = "http://";
    if (url.compare(0, kScheme.size(), kScheme) != 0) {
        return Err<ServerAddress>(ErrorCode::InvalidArgument,
                                  "server url must start with http:// (got '" + url + "')");
    }

    std::string rest = url.substr(kScheme.size());
    ServerAddress address;

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        address.base_path = rest.substr(slash);
        rest.resize(slash);
        while (!address.base_path.empty() && address.base_path.back() == '/') {
            address.base_path.pop_back();
        }
    }

    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string port = rest.substr(colon + 1);
        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
            return Err<ServerAddress>(ErrorCode::InvalidArgument, "invalid port in '" + url + "'");
        }
        address.port = static_cast<std::uint16_t>(value);
        rest.resize(colon);
    }

    if (rest.empty()) {
        return Err<ServerAddress>(ErrorCode::InvalidArgument, "missing host in '" + url + "'");
    }
    address.host = rest;
    return Ok(std::move(address));
}

std::string ServerAddress::host_header() const {
    return port == 80 ? host : host + ":" + std::to_string(port);
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(ServerAddress address, std::chrono::milliseconds timeout)
    : address_(std::move(address))
    , timeout_(timeout) {
}

Result<HttpClient> HttpClient::create(const std::string& base_url, std::chrono::milliseconds timeout) {
    auto address = ServerAddress::parse(base_url);
    if (address.is_error()) {
        return Err<HttpClient>(address.error());
    }
    if (timeout.count() <= 0) {
        return Err<HttpClient>(ErrorCode::InvalidArgument, "request timeout must be positive");
    }
    return Ok(HttpClient(std::move(address.value()), timeout));
}

Result<HttpResponse> HttpClient::send(HttpRequest request) const {
    request.url = address_.base_path + request.url;
    request.version = HttpVersion::HTTP_1_1;
    request.set_header("Host", address_.host_header());
    request.set_header("Connection", "close");
    if (!request.body.empty() || request.method == HttpMethod::POST ||
        request.method == HttpMethod::PUT) {
        request.set_header("Content-Length", std::to_string(request.body.size()));
    }

    asio::io_context io;
    Exchange exchange(io, address_, request.serialize());
    exchange.start();
    io.run_for(timeout_);

    if (!exchange.done()) {
        exchange.abort();
        spdlog::debug("{} {} timed out after {} ms",
                      HttpMethodUtils::to_string(request.method), request.url, timeout_.count());
        return Err<HttpResponse>(ErrorCode::TransientTransport,
                                 "request timed out after " + std::to_string(timeout_.count()) + " ms");
    }
    if (exchange.failed()) {
        return Err<HttpResponse>(exchange.error());
    }
    return Ok(exchange.response());
}

} // namespace ixcp::network
