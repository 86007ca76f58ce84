#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/network/http_types.hpp"
#include "ixcp/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ixcp::network {

/**
 * @brief Wire format shared by UploadService and HttpUploadTransport
 *
 * POST /upload carries the ciphertext as the raw body and everything else
 * as headers:
 *
 *   Authorization: Bearer <api key>
 *   X-Chunk-Index: <sequence index, decimal>
 *   X-File-Name:   <client file name>
 *   X-Session-Id:  <session id>
 *   X-Key-Id:      <receiver key id the session key was wrapped for>
 *   X-Wrapped-Key: <base64 RSA-OAEP ciphertext of the session key>
 *   X-Nonce:       <hex, 12 bytes>
 *   X-Auth-Tag:    <hex, 16 bytes>
 */
namespace protocol {

inline constexpr const char* kPublicKeyPath = "/public-key";
inline constexpr const char* kUploadPath = "/upload";
inline constexpr const char* kStatusPath = "/upload/status";
inline constexpr const char* kCompletePath = "/upload/complete";

inline constexpr const char* kHeaderChunkIndex = "X-Chunk-Index";
inline constexpr const char* kHeaderFileName = "X-File-Name";
inline constexpr const char* kHeaderSessionId = "X-Session-Id";
inline constexpr const char* kHeaderKeyId = "X-Key-Id";
inline constexpr const char* kHeaderWrappedKey = "X-Wrapped-Key";
inline constexpr const char* kHeaderNonce = "X-Nonce";
inline constexpr const char* kHeaderAuthTag = "X-Auth-Tag";

inline constexpr const char* kMessageReceived = "Chunk received";
inline constexpr const char* kMessageDuplicate = "Chunk already received (skipped)";

/// Comma-separated list for Access-Control-Allow-Headers.
std::string allowed_headers();

/// Token from "Authorization: Bearer <token>", if present.
std::optional<std::string> bearer_token(const HttpRequest& request);

HttpRequest encode_upload(const transfer::EncryptedPacket& packet, const std::string& api_key);

/// PayloadRejected naming the first missing or malformed header.
Result<transfer::EncryptedPacket> decode_upload(const HttpRequest& request);

HttpResponse json_response(HttpStatus status, const nlohmann::json& body);
HttpResponse error_response(HttpStatus status, const std::string& message);

nlohmann::json ack_to_json(const transfer::ChunkAck& ack);
Result<transfer::ChunkAck> ack_from_json(const nlohmann::json& body);

nlohmann::json finalized_to_json(const transfer::FinalizedFile& file);
Result<transfer::FinalizedFile> finalized_from_json(const nlohmann::json& body);

/// "error" field of an error body, or the raw text when it is not JSON.
std::string error_message(const HttpResponse& response);

} // namespace protocol
} // namespace ixcp::network
