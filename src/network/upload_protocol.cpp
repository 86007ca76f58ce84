#include "ixcp/network/upload_protocol.hpp"

#include <charconv>

namespace ixcp::network::protocol {

using json = nlohmann::json;

namespace {

Result<std::string> required_header(const HttpRequest& request, const char* name) {
    auto value = find_header(request.headers, name);
    if (!value || value->empty()) {
        return Err<std::string>(ErrorCode::PayloadRejected, std::string("missing header ") + name);
    }
    return Ok(std::move(*value));
}

Result<std::uint32_t> parse_index(const std::string& text) {
    std::uint32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return Err<std::uint32_t>(ErrorCode::PayloadRejected,
                                  std::string("invalid ") + kHeaderChunkIndex + " '" + text + "'");
    }
    return Ok(value);
}

Result<Bytes> decode_header(const HttpRequest& request, const char* name, bool base64) {
    auto text = required_header(request, name);
    if (text.is_error()) {
        return Err<Bytes>(text.error());
    }
    auto decoded = base64 ? base64_decode(text.value()) : hex_decode(text.value());
    if (decoded.is_error()) {
        return Err<Bytes>(ErrorCode::PayloadRejected,
                          std::string("malformed ") + name + ": " + decoded.error().message);
    }
    return decoded;
}

} // namespace

std::string allowed_headers() {
    return std::string("Content-Type, Authorization, ") + kHeaderFileName + ", " + kHeaderChunkIndex +
           ", " + kHeaderSessionId + ", " + kHeaderKeyId + ", " + kHeaderWrappedKey + ", " +
           kHeaderNonce + ", " + kHeaderAuthTag;
}

std::optional<std::string> bearer_token(const HttpRequest& request) {
    static const std::string kPrefix = "Bearer ";
    auto header = find_header(request.headers, "Authorization");
    if (!header || header->compare(0, kPrefix.size(), kPrefix) != 0) {
        return std::nullopt;
    }
    return header->substr(kPrefix.size());
}

HttpRequest encode_upload(const transfer::EncryptedPacket& packet, const std::string& api_key) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = kUploadPath;
    request.set_header("Authorization", "Bearer " + api_key);
    request.set_header("Content-Type", "application/octet-stream");
    request.set_header(kHeaderChunkIndex, std::to_string(packet.sequence_index));
    request.set_header(kHeaderFileName, packet.file_name);
    request.set_header(kHeaderSessionId, packet.session_id);
    request.set_header(kHeaderKeyId, packet.key_id);
    request.set_header(kHeaderWrappedKey, base64_encode(packet.wrapped_key));
    request.set_header(kHeaderNonce, hex_encode(packet.nonce));
    request.set_header(kHeaderAuthTag, hex_encode(packet.auth_tag));
    request.set_body(packet.ciphertext);
    return request;
}

Result<transfer::EncryptedPacket> decode_upload(const HttpRequest& request) {
    transfer::EncryptedPacket packet;

    auto index_text = required_header(request, kHeaderChunkIndex);
    if (index_text.is_error()) {
        return Err<transfer::EncryptedPacket>(index_text.error());
    }
    auto index = parse_index(index_text.value());
    if (index.is_error()) {
        return Err<transfer::EncryptedPacket>(index.error());
    }
    packet.sequence_index = index.value();

    auto file_name = required_header(request, kHeaderFileName);
    if (file_name.is_error()) {
        return Err<transfer::EncryptedPacket>(file_name.error());
    }
    packet.file_name = std::move(file_name.value());

    auto session_id = required_header(request, kHeaderSessionId);
    if (session_id.is_error()) {
        return Err<transfer::EncryptedPacket>(session_id.error());
    }
    packet.session_id = std::move(session_id.value());

    auto key_id = required_header(request, kHeaderKeyId);
    if (key_id.is_error()) {
        return Err<transfer::EncryptedPacket>(key_id.error());
    }
    packet.key_id = std::move(key_id.value());

    auto wrapped = decode_header(request, kHeaderWrappedKey, true);
    if (wrapped.is_error()) {
        return Err<transfer::EncryptedPacket>(wrapped.error());
    }
    packet.wrapped_key = std::move(wrapped.value());

    auto nonce = decode_header(request, kHeaderNonce, false);
    if (nonce.is_error()) {
        return Err<transfer::EncryptedPacket>(nonce.error());
    }
    packet.nonce = std::move(nonce.value());

    auto tag = decode_header(request, kHeaderAuthTag, false);
    if (tag.is_error()) {
        return Err<transfer::EncryptedPacket>(tag.error());
    }
    packet.auth_tag = std::move(tag.value());

    packet.ciphertext = request.body;
    packet.status = transfer::PacketStatus::Sent;
    return Ok(std::move(packet));
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse error_response(HttpStatus status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

json ack_to_json(const transfer::ChunkAck& ack) {
    return json{
        {"message", ack.already_received ? kMessageDuplicate : kMessageReceived},
        {"actualFilename", ack.file_key},
        {"chunkIndex", ack.chunk_index},
        {"clientFilename", ack.client_file_name},
        {"alreadyReceived", ack.already_received},
    };
}

Result<transfer::ChunkAck> ack_from_json(const json& body) {
    if (!body.is_object() || !body.contains("chunkIndex") || !body["chunkIndex"].is_number_unsigned()) {
        return Err<transfer::ChunkAck>(ErrorCode::ProtocolError, "upload response lacks chunkIndex");
    }
    transfer::ChunkAck ack;
    ack.chunk_index = body["chunkIndex"].get<std::uint32_t>();
    ack.file_key = body.value("actualFilename", std::string{});
    ack.client_file_name = body.value("clientFilename", std::string{});
    ack.already_received = body.value("alreadyReceived", false);
    return Ok(std::move(ack));
}

json finalized_to_json(const transfer::FinalizedFile& file) {
    return json{
        {"filename", file.file_key},
        {"chunkCount", file.chunk_count},
        {"totalBytes", file.total_bytes},
        {"sha256", file.sha256},
    };
}

Result<transfer::FinalizedFile> finalized_from_json(const json& body) {
    if (!body.is_object() || !body.contains("filename") || !body.contains("chunkCount")) {
        return Err<transfer::FinalizedFile>(ErrorCode::ProtocolError,
                                            "complete response lacks filename or chunkCount");
    }
    transfer::FinalizedFile file;
    try {
        file.file_key = body.at("filename").get<std::string>();
        file.chunk_count = body.at("chunkCount").get<std::uint32_t>();
        file.total_bytes = body.value("totalBytes", std::uint64_t{0});
        file.sha256 = body.value("sha256", std::string{});
    } catch (const json::exception& e) {
        return Err<transfer::FinalizedFile>(ErrorCode::ProtocolError,
                                            std::string("complete response: ") + e.what());
    }
    return Ok(std::move(file));
}

std::string error_message(const HttpResponse& response) {
    const std::string text = response.body_as_string();
    auto body = json::parse(text, nullptr, false);
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    if (!text.empty()) {
        return text;
    }
    return std::to_string(response.status_code) + " " + response.reason_phrase;
}

} // namespace ixcp::network::protocol
