#include "ixcp/transfer/http_upload_transport.hpp"

#include "ixcp/network/upload_protocol.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ixcp::transfer {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
namespace protocol = network::protocol;

// ──────────────────────────────────────────────────────────
// RestUploadTransport
// ──────────────────────────────────────────────────────────

RestUploadTransport::RestUploadTransport(std::string api_key)
    : api_key_(std::move(api_key)) {
}

Error RestUploadTransport::error_for(const HttpResponse& response) {
    const int status = response.status_code;
    const std::string detail =
        "HTTP " + std::to_string(status) + ": " + protocol::error_message(response);

    if (status == 401 || status == 403) {
        return Error(ErrorCode::AuthenticationRejected, detail);
    }
    if (status == 400 || status == 422) {
        return Error(ErrorCode::PayloadRejected, detail);
    }
    if (status == 404) {
        return Error(ErrorCode::NotFound, detail);
    }
    if (status == 409) {
        return Error(ErrorCode::IncompleteTransfer, detail);
    }
    if (status == 408 || status == 429 || status >= 500) {
        return Error(ErrorCode::TransientTransport, detail);
    }
    return Error(ErrorCode::ProtocolError, "unexpected " + detail);
}

HttpRequest RestUploadTransport::authorized(HttpMethod method, std::string url) const {
    HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.set_header("Authorization", "Bearer " + api_key_);
    return request;
}

Result<json> RestUploadTransport::exchange_json(HttpRequest request) {
    auto response = send(std::move(request));
    if (response.is_error()) {
        return Err<json>(response.error());
    }
    const HttpResponse& res = response.value();
    if (res.status_code < 200 || res.status_code >= 300) {
        return Err<json>(error_for(res));
    }

    auto body = json::parse(res.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
        return Err<json>(ErrorCode::ProtocolError, "response body is not JSON");
    }
    return Ok(std::move(body));
}

Result<crypto::PublicKeyRecord> RestUploadTransport::fetch_public_key() {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = protocol::kPublicKeyPath;

    auto body = exchange_json(std::move(request));
    if (body.is_error()) {
        return Err<crypto::PublicKeyRecord>(body.error());
    }

    const json& j = body.value();
    if (!j.is_object() || !j.contains("publicKey") || !j["publicKey"].is_string()) {
        return Err<crypto::PublicKeyRecord>(ErrorCode::ProtocolError,
                                            "public key response lacks publicKey");
    }
    crypto::PublicKeyRecord record;
    record.pem = j["publicKey"].get<std::string>();
    record.key_id = j.value("keyId", std::string{});
    return Ok(std::move(record));
}

Result<ChunkAck> RestUploadTransport::upload_chunk(const EncryptedPacket& packet) {
    auto body = exchange_json(protocol::encode_upload(packet, api_key_));
    if (body.is_error()) {
        return Err<ChunkAck>(body.error());
    }

    auto ack = protocol::ack_from_json(body.value());
    if (ack.is_error()) {
        return ack;
    }
    if (ack.value().chunk_index != packet.sequence_index) {
        return Err<ChunkAck>(ErrorCode::ProtocolError,
                             "acknowledged chunk " + std::to_string(ack.value().chunk_index) +
                             " instead of " + std::to_string(packet.sequence_index));
    }
    return ack;
}

Result<std::vector<std::uint32_t>> RestUploadTransport::query_status(const std::string& file_key) {
    auto body = exchange_json(authorized(
        HttpMethod::GET,
        std::string(protocol::kStatusPath) + "?filename=" + network::url_encode(file_key)));
    if (body.is_error()) {
        return Err<std::vector<std::uint32_t>>(body.error());
    }

    const json& j = body.value();
    if (!j.is_object() || !j.contains("receivedChunks") || !j["receivedChunks"].is_array()) {
        return Err<std::vector<std::uint32_t>>(ErrorCode::ProtocolError,
                                               "status response lacks receivedChunks");
    }

    std::vector<std::uint32_t> received;
    for (const auto& entry : j["receivedChunks"]) {
        if (!entry.is_number_unsigned()) {
            return Err<std::vector<std::uint32_t>>(ErrorCode::ProtocolError,
                                                   "non-integer entry in receivedChunks");
        }
        received.push_back(entry.get<std::uint32_t>());
    }
    std::sort(received.begin(), received.end());
    received.erase(std::unique(received.begin(), received.end()), received.end());
    return Ok(std::move(received));
}

Result<FinalizedFile> RestUploadTransport::finalize(const std::string& file_key,
                                                    std::uint32_t total_chunks,
                                                    const std::string& session_id) {
    auto request = authorized(HttpMethod::POST, protocol::kCompletePath);
    request.set_header("Content-Type", "application/json");
    request.set_body(json{
        {"filename", file_key},
        {"totalChunks", total_chunks},
        {"sessionId", session_id},
    }.dump());

    auto body = exchange_json(std::move(request));
    if (body.is_error()) {
        return Err<FinalizedFile>(body.error());
    }
    return protocol::finalized_from_json(body.value());
}

Result<void> RestUploadTransport::discard(const std::string& file_key) {
    auto body = exchange_json(authorized(
        HttpMethod::DELETE_METHOD,
        std::string(protocol::kUploadPath) + "?filename=" + network::url_encode(file_key)));
    if (body.is_error()) {
        return Err<void>(body.error());
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// HttpUploadTransport
// ──────────────────────────────────────────────────────────

HttpUploadTransport::HttpUploadTransport(network::HttpClient client, std::string api_key)
    : RestUploadTransport(std::move(api_key))
    , client_(std::move(client)) {
}

Result<HttpResponse> HttpUploadTransport::send(HttpRequest request) {
    return client_.send(std::move(request));
}

// ──────────────────────────────────────────────────────────
// LoopbackTransport
// ──────────────────────────────────────────────────────────

LoopbackTransport::LoopbackTransport(const network::HttpRouter& router, std::string api_key)
    : RestUploadTransport(std::move(api_key))
    , router_(router) {
}

void LoopbackTransport::set_fault_injector(FaultInjector injector) {
    std::lock_guard lock(mutex_);
    injector_ = std::move(injector);
}

Result<HttpResponse> LoopbackTransport::send(HttpRequest request) {
    {
        std::lock_guard lock(mutex_);
        if (injector_) {
            if (auto fault = injector_(request)) {
                spdlog::debug("Loopback fault on {} {}: {}",
                              network::HttpMethodUtils::to_string(request.method),
                              request.url, fault->message);
                return Err<HttpResponse>(*fault);
            }
        }
    }
    return Ok(router_.handle_request(request));
}

} // namespace ixcp::transfer
