#include "ixcp/network/http_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ixcp::network {

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) ++begin;
    while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t')) --end;
    return text.substr(begin, end - begin);
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

Result<HttpVersion> parse_version(const std::string& text) {
    if (text == "HTTP/1.1") return Ok(HttpVersion::HTTP_1_1);
    if (text == "HTTP/1.0") return Ok(HttpVersion::HTTP_1_0);
    return Err<HttpVersion>(ErrorCode::ProtocolError, "unsupported HTTP version '" + text + "'");
}

} // namespace

// ──────────────────────────────────────────────────────────
// HttpMessageParser
// ──────────────────────────────────────────────────────────

void HttpMessageParser::reset_state() {
    state_ = ParseState::START_LINE;
    line_buffer_.clear();
    header_bytes_ = 0;
    line_number_ = 1;
    remaining_body_.reset();
}

Result<bool> HttpMessageParser::fail(const std::string& message) {
    state_ = ParseState::PARSE_ERROR;
    return Err<bool>(ErrorCode::ProtocolError,
                     message + " at line " + std::to_string(line_number_));
}

Result<bool> HttpMessageParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        switch (state_) {
            case ParseState::START_LINE:
            case ParseState::HEADER_LINE: {
                const char c = data[i++];
                if (++header_bytes_ > kMaxHeaderBytes) {
                    return fail("header section too large");
                }
                if (c != '\n') {
                    line_buffer_ += c;
                    break;
                }
                if (!line_buffer_.empty() && line_buffer_.back() == '\r') {
                    line_buffer_.pop_back();
                }
                std::string line;
                line.swap(line_buffer_);
                auto consumed = consume_line(line);
                if (consumed.is_error()) {
                    return fail(consumed.error().message);
                }
                ++line_number_;
                break;
            }

            case ParseState::BODY: {
                std::size_t take = len - i;
                if (remaining_body_) {
                    take = std::min(take, *remaining_body_);
                }
                if (body().size() + take > max_body_bytes_) {
                    return fail("body exceeds " + std::to_string(max_body_bytes_) + " bytes");
                }
                body().insert(body().end(),
                              reinterpret_cast<const std::uint8_t*>(data + i),
                              reinterpret_cast<const std::uint8_t*>(data + i + take));
                i += take;
                if (remaining_body_) {
                    *remaining_body_ -= take;
                    if (*remaining_body_ == 0) {
                        state_ = ParseState::COMPLETE;
                    }
                }
                break;
            }

            case ParseState::COMPLETE:
                // Trailing bytes belong to a pipelined message; not supported.
                return Ok(true);

            case ParseState::PARSE_ERROR:
                return Err<bool>(ErrorCode::ProtocolError, "parser in error state");
        }

        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
    }
    return Ok(state_ == ParseState::COMPLETE);
}

Result<void> HttpMessageParser::consume_line(const std::string& line) {
    if (state_ == ParseState::START_LINE) {
        if (line.empty()) {
            // Tolerate stray CRLF between messages (RFC 7230 3.5)
            return Ok();
        }
        auto started = parse_start_line(line);
        if (started.is_error()) {
            return started;
        }
        state_ = ParseState::HEADER_LINE;
        return Ok();
    }

    if (line.empty()) {
        return begin_body();
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return Err<void>(ErrorCode::ProtocolError, "malformed header line");
    }
    const std::string name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), is_token_char)) {
        return Err<void>(ErrorCode::ProtocolError, "invalid header name '" + name + "'");
    }
    headers()[name] = trim(line.substr(colon + 1));
    return Ok();
}

Result<void> HttpMessageParser::begin_body() {
    const auto encoding = find_header(headers(), "Transfer-Encoding");
    if (encoding && !encoding->empty() && *encoding != "identity") {
        return Err<void>(ErrorCode::ProtocolError,
                         "transfer encoding '" + *encoding + "' is not supported");
    }

    const auto length_header = find_header(headers(), "Content-Length");
    if (!length_header) {
        if (body_until_close()) {
            state_ = ParseState::BODY;
        } else {
            state_ = ParseState::COMPLETE;
        }
        return Ok();
    }

    std::size_t length = 0;
    const char* first = length_header->data();
    const char* last = first + length_header->size();
    const auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc() || ptr != last) {
        return Err<void>(ErrorCode::ProtocolError,
                         "invalid Content-Length '" + *length_header + "'");
    }
    if (length > max_body_bytes_) {
        return Err<void>(ErrorCode::ProtocolError,
                         "Content-Length " + std::to_string(length) + " exceeds limit");
    }

    if (length == 0) {
        state_ = ParseState::COMPLETE;
        return Ok();
    }
    body().reserve(length);
    remaining_body_ = length;
    state_ = ParseState::BODY;
    return Ok();
}

// ──────────────────────────────────────────────────────────
// HttpParser (requests)
// ──────────────────────────────────────────────────────────

Result<void> HttpParser::parse_start_line(const std::string& line) {
    // METHOD SP target SP version
    const auto first_space = line.find(' ');
    const auto last_space = line.rfind(' ');
    if (first_space == std::string::npos || first_space == last_space) {
        return Err<void>(ErrorCode::ProtocolError, "malformed request line");
    }

    const std::string method = line.substr(0, first_space);
    request_.method = HttpMethodUtils::from_string(method);
    if (request_.method == HttpMethod::UNKNOWN) {
        return Err<void>(ErrorCode::ProtocolError, "unknown HTTP method '" + method + "'");
    }

    request_.url = line.substr(first_space + 1, last_space - first_space - 1);
    if (request_.url.empty() || request_.url.find(' ') != std::string::npos) {
        return Err<void>(ErrorCode::ProtocolError, "malformed request target");
    }
    for (const char c : request_.url) {
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return Err<void>(ErrorCode::ProtocolError, "non-printable byte in request target");
        }
    }

    auto version = parse_version(line.substr(last_space + 1));
    if (version.is_error()) {
        return Err<void>(version.error());
    }
    request_.version = version.value();
    return Ok();
}

// ──────────────────────────────────────────────────────────
// HttpResponseParser
// ──────────────────────────────────────────────────────────

Result<void> HttpResponseParser::parse_start_line(const std::string& line) {
    // version SP status SP reason
    const auto first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return Err<void>(ErrorCode::ProtocolError, "malformed status line");
    }

    auto version = parse_version(line.substr(0, first_space));
    if (version.is_error()) {
        return Err<void>(version.error());
    }
    response_.version = version.value();

    const auto second_space = line.find(' ', first_space + 1);
    const std::string code = line.substr(first_space + 1,
        second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);

    int status = 0;
    const auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec != std::errc() || ptr != code.data() + code.size() || status < 100 || status > 599) {
        return Err<void>(ErrorCode::ProtocolError, "invalid status code '" + code + "'");
    }
    response_.status_code = status;
    response_.reason_phrase =
        second_space == std::string::npos ? std::string() : line.substr(second_space + 1);
    return Ok();
}

Result<void> HttpResponseParser::finish() {
    if (is_complete()) {
        return Ok();
    }
    if (state() == ParseState::BODY && !remaining_body_) {
        mark_complete();
        return Ok();
    }
    return Err<void>(ErrorCode::TransientTransport, "connection closed before response was complete");
}

} // namespace ixcp::network
