#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/network/http_types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ixcp::network {

/**
 * @brief Parser states shared by the request and response parsers
 *
 * HTTP/1.x message format:
 * START-LINE CRLF                  <- request line or status line
 * Header-Name: Header-Value CRLF   <- zero or more
 * CRLF
 * [Body]                           <- Content-Length bytes
 */
enum class ParseState {
    START_LINE,
    HEADER_LINE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x message parser
 *
 * Data may arrive in arbitrary slices; feed each one to parse() until it
 * returns true. Header lines are assembled line by line and the body is
 * copied in bulk once Content-Length is known. Chunked transfer encoding is
 * refused with ProtocolError.
 *
 * Subclasses interpret the start line and own the message object.
 */
class HttpMessageParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
    static constexpr std::size_t kDefaultMaxBodyBytes = 64 * 1024 * 1024;

    explicit HttpMessageParser(std::size_t max_body_bytes = kDefaultMaxBodyBytes)
        : max_body_bytes_(max_body_bytes) {}
    virtual ~HttpMessageParser() = default;

    /**
     * @return true once a full message is available, false if more data is
     *         needed; ProtocolError on malformed input
     */
    Result<bool> parse(const char* data, std::size_t len);

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

protected:
    void reset_state();
    void mark_complete() { state_ = ParseState::COMPLETE; }

    virtual Result<void> parse_start_line(const std::string& line) = 0;
    virtual HeaderMap& headers() = 0;
    virtual std::vector<std::uint8_t>& body() = 0;

    /// Whether a message without Content-Length runs until the peer closes.
    virtual bool body_until_close() const { return false; }

    std::optional<std::size_t> remaining_body_;

private:
    Result<void> consume_line(const std::string& line);
    Result<void> begin_body();
    Result<bool> fail(const std::string& message);

    std::size_t max_body_bytes_;
    ParseState state_ = ParseState::START_LINE;
    std::string line_buffer_;
    std::size_t header_bytes_ = 0;
    std::size_t line_number_ = 1;
};

/**
 * @brief Parses requests on the server side
 *
 * Usage example:
 * ```cpp
 * HttpParser parser;
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_ok() && result.value()) {
 *     HttpRequest request = parser.get_request();
 * }
 * ```
 */
class HttpParser : public HttpMessageParser {
public:
    explicit HttpParser(std::size_t max_body_bytes = kDefaultMaxBodyBytes)
        : HttpMessageParser(max_body_bytes) {}

    const HttpRequest& get_request() const { return request_; }

    void reset() {
        reset_state();
        request_ = HttpRequest();
    }

protected:
    Result<void> parse_start_line(const std::string& line) override;
    HeaderMap& headers() override { return request_.headers; }
    std::vector<std::uint8_t>& body() override { return request_.body; }

private:
    HttpRequest request_;
};

/**
 * @brief Parses responses on the client side
 *
 * A response without Content-Length is read until the connection closes;
 * call finish() at end of stream to complete it.
 */
class HttpResponseParser : public HttpMessageParser {
public:
    explicit HttpResponseParser(std::size_t max_body_bytes = kDefaultMaxBodyBytes)
        : HttpMessageParser(max_body_bytes) {}

    const HttpResponse& get_response() const { return response_; }

    /// Signals end of stream. Succeeds only if the message is complete.
    Result<void> finish();

    void reset() {
        reset_state();
        response_ = HttpResponse();
    }

protected:
    Result<void> parse_start_line(const std::string& line) override;
    HeaderMap& headers() override { return response_.headers; }
    std::vector<std::uint8_t>& body() override { return response_.body; }
    bool body_until_close() const override { return true; }

private:
    HttpResponse response_;
};

} // namespace ixcp::network
