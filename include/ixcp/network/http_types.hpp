#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ixcp::network {

/**
 * @brief HTTP request methods understood by the router
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid the Windows DELETE macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes produced by the upload service
 *
 * The client maps these back to ErrorCode values, so adding a code here
 * usually means extending http_upload_transport.cpp as well.
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Case-insensitive lookup; headers are stored as received.
std::optional<std::string> find_header(const HeaderMap& headers, std::string_view name);

/// Percent-decoding for query strings ('+' becomes a space).
std::string url_decode(std::string_view text);

/// Percent-encoding of everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view text);

/**
 * @brief Parsed HTTP request
 *
 * url keeps the raw request target ("/upload/status?filename=a.bin");
 * path() and query_param() split it on demand.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name).value_or("");
    }

    bool has_header(const std::string& name) const {
        return find_header(headers, name).has_value();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /// Target without the query string.
    std::string path() const;

    /// Decoded value of the first occurrence of @p name in the query string.
    std::optional<std::string> query_param(const std::string& name) const;

    void set_body(const std::string& content);
    void set_body(const std::vector<std::uint8_t>& data);

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /// Request line, headers and body in wire format.
    std::vector<std::uint8_t> serialize() const;
};

/**
 * @brief HTTP response, built by handlers and parsed by the client
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<std::uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_body(const std::vector<std::uint8_t>& data) {
        body = data;
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name).value_or("");
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    std::vector<std::uint8_t> serialize() const;

    static std::string get_reason_phrase(HttpStatus status);
    static std::string version_to_string(HttpVersion version);
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str);
    static std::string to_string(HttpMethod method);
};

} // namespace ixcp::network
