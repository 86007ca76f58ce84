#include "ixcp/network/http_types.hpp"

#include <strings.h>

#include <cctype>
#include <sstream>

namespace ixcp::network {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_headers(std::ostringstream& oss, const HeaderMap& headers) {
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
}

std::vector<std::uint8_t> join(const std::string& head, const std::vector<std::uint8_t>& body) {
    std::vector<std::uint8_t> result(head.begin(), head.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace

std::optional<std::string> find_header(const HeaderMap& headers, std::string_view name) {
    const std::string wanted(name);
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), wanted.c_str()) == 0) {
            return value;
        }
    }
    return std::nullopt;
}

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string url_encode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[u >> 4];
            out += kHex[u & 0x0F];
        }
    }
    return out;
}

// ──────────────────────────────────────────────────────────
// HttpRequest
// ──────────────────────────────────────────────────────────

std::string HttpRequest::path() const {
    const auto pos = url.find('?');
    return pos == std::string::npos ? url : url.substr(0, pos);
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
    const auto pos = url.find('?');
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string_view query(url);
    query.remove_prefix(pos + 1);

    while (!query.empty()) {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        const auto eq = pair.find('=');
        const std::string key = url_decode(pair.substr(0, eq));
        if (key == name) {
            return eq == std::string_view::npos ? std::string() : url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

void HttpRequest::set_body(const std::string& content) {
    body.assign(content.begin(), content.end());
    headers["Content-Length"] = std::to_string(body.size());
}

void HttpRequest::set_body(const std::vector<std::uint8_t>& data) {
    body = data;
    headers["Content-Length"] = std::to_string(body.size());
}

std::vector<std::uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;
    oss << HttpMethodUtils::to_string(method) << " " << url << " "
        << HttpResponse::version_to_string(version) << "\r\n";
    append_headers(oss, headers);
    return join(oss.str(), body);
}

// ──────────────────────────────────────────────────────────
// HttpResponse
// ──────────────────────────────────────────────────────────

std::vector<std::uint8_t> HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << version_to_string(version) << " " << status_code << " " << reason_phrase << "\r\n";
    append_headers(oss, headers);
    return join(oss.str(), body);
}

std::string HttpResponse::get_reason_phrase(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::CREATED: return "Created";
        case HttpStatus::NO_CONTENT: return "No Content";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::UNAUTHORIZED: return "Unauthorized";
        case HttpStatus::FORBIDDEN: return "Forbidden";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpStatus::CONFLICT: return "Conflict";
        case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
        case HttpStatus::UNPROCESSABLE_ENTITY: return "Unprocessable Entity";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
    }
    return "Unknown";
}

std::string HttpResponse::version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.1";
    }
}

// ──────────────────────────────────────────────────────────
// HttpMethodUtils
// ──────────────────────────────────────────────────────────

HttpMethod HttpMethodUtils::from_string(const std::string& method_str) {
    if (method_str == "GET") return HttpMethod::GET;
    if (method_str == "POST") return HttpMethod::POST;
    if (method_str == "PUT") return HttpMethod::PUT;
    if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
    if (method_str == "HEAD") return HttpMethod::HEAD;
    if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::string HttpMethodUtils::to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

} // namespace ixcp::network
