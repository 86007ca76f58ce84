#include "ixcp/server/upload_service.hpp"

#include "ixcp/crypto/envelope_crypto.hpp"
#include "ixcp/events/events.hpp"
#include "ixcp/network/upload_protocol.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <limits>

namespace ixcp::server {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
namespace protocol = network::protocol;

namespace {

constexpr const char* kAuthFailureMessage = "Invalid or missing API key";

bool same_secret(const std::string& a, const std::string& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

HttpResponse error_for(const Error& error) {
    return protocol::error_response(UploadService::status_for(error.code), error.message);
}

Result<std::string> filename_param(const HttpContext& ctx) {
    auto filename = ctx.request.query_param("filename");
    if (!filename || filename->empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Missing filename parameter");
    }
    return Ok(std::move(*filename));
}

} // namespace

UploadService::UploadService(storage::KeyValueStore& store,
                             const KeyRing& keys,
                             std::filesystem::path output_dir,
                             std::string api_key,
                             events::EventBus* bus)
    : keys_(keys)
    , api_key_(std::move(api_key))
    , bus_(bus)
    , ledger_(store, std::move(output_dir), bus)
    , sessions_(store, keys.lookup(), bus) {
}

void UploadService::set_file_namer(FileNamer namer) {
    namer_ = std::move(namer);
}

Result<std::string> UploadService::stored_name(const std::string& client_name) const {
    auto file_key = transfer::ChunkLedger::file_key_for(client_name);
    if (file_key.is_error() || !namer_) {
        return file_key;
    }

    auto named = namer_(file_key.value());
    if (named.is_error()) {
        return named;
    }
    auto checked = transfer::ChunkLedger::file_key_for(named.value());
    if (checked.is_error() || checked.value() != named.value()) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "File namer produced an unusable name for " + file_key.value());
    }
    return named;
}

network::HttpStatus UploadService::status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::PayloadRejected:
        case ErrorCode::ProtocolError:
        case ErrorCode::DuplicateChunk:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::AuthenticationRejected:
            return HttpStatus::UNAUTHORIZED;
        case ErrorCode::NotFound:
            return HttpStatus::NOT_FOUND;
        case ErrorCode::IncompleteTransfer:
        case ErrorCode::ContentMismatch:
            return HttpStatus::CONFLICT;
        case ErrorCode::AuthenticationFailure:
        case ErrorCode::KeyUnwrapFailure:
            return HttpStatus::UNPROCESSABLE_ENTITY;
        case ErrorCode::TransientTransport:
        case ErrorCode::Cancelled:
            return HttpStatus::SERVICE_UNAVAILABLE;
        case ErrorCode::StorageFailure:
        case ErrorCode::IoFailure:
        case ErrorCode::CryptoFailure:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

void UploadService::register_routes(network::HttpRouter& router) {
    router.use([this](const HttpContext& ctx, HttpResponse& response) {
        return authorize(ctx, response);
    });

    router.add_response_filter([](const network::HttpRequest&, HttpResponse& response) {
        response.set_header("Access-Control-Allow-Origin", "*");
        response.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        response.set_header("Access-Control-Allow-Headers", protocol::allowed_headers());
        response.set_header("Access-Control-Max-Age", "3600");
    });

    router.get(protocol::kPublicKeyPath, [this](const HttpContext& ctx) { return handle_public_key(ctx); });
    router.post(protocol::kUploadPath, [this](const HttpContext& ctx) { return handle_upload(ctx); });
    router.delete_(protocol::kUploadPath, [this](const HttpContext& ctx) { return handle_delete(ctx); });
    router.get(protocol::kStatusPath, [this](const HttpContext& ctx) { return handle_status(ctx); });
    router.post(protocol::kCompletePath, [this](const HttpContext& ctx) { return handle_complete(ctx); });
}

bool UploadService::authorize(const HttpContext& ctx, HttpResponse& response) const {
    if (ctx.request.path() == protocol::kPublicKeyPath) {
        return true;
    }

    auto token = protocol::bearer_token(ctx.request);
    if (token && same_secret(*token, api_key_)) {
        return true;
    }

    spdlog::warn("Rejected {} {}: {}",
                 network::HttpMethodUtils::to_string(ctx.request.method),
                 ctx.request.path(), kAuthFailureMessage);
    response = protocol::error_response(HttpStatus::UNAUTHORIZED, kAuthFailureMessage);
    return false;
}

// ──────────────────────────────────────────────────────────
// Routes
// ──────────────────────────────────────────────────────────

HttpResponse UploadService::handle_public_key(const HttpContext&) const {
    auto pem = keys_.current().public_key().to_pem();
    if (pem.is_error()) {
        spdlog::error("Exporting public key: {}", pem.error().message);
        return error_for(pem.error());
    }
    return protocol::json_response(HttpStatus::OK, json{
        {"keyId", keys_.current().key_id()},
        {"publicKey", pem.value()},
    });
}

HttpResponse UploadService::handle_upload(const HttpContext& ctx) {
    auto decoded = protocol::decode_upload(ctx.request);
    if (decoded.is_error()) {
        return reject(ctx.request.get_header(protocol::kHeaderFileName), 0, decoded.error());
    }
    const transfer::EncryptedPacket& packet = decoded.value();

    auto client_key = transfer::ChunkLedger::file_key_for(packet.file_name);
    if (client_key.is_error()) {
        return reject(packet.file_name, packet.sequence_index, client_key.error());
    }
    auto file_key = stored_name(packet.file_name);
    if (file_key.is_error()) {
        return reject(packet.file_name, packet.sequence_index, file_key.error());
    }

    auto session = sessions_.open_or_resume(packet.session_id, packet.key_id, packet.wrapped_key,
                                            file_key.value());
    if (session.is_error()) {
        return reject(file_key.value(), packet.sequence_index, session.error());
    }

    // Binding the session id and file key means a packet replayed into
    // another session or file fails authentication.
    const Bytes aad = crypto::build_associated_data(packet.session_id, client_key.value());
    auto payload = crypto::decrypt_chunk(session.value()->key(), packet.nonce,
                                         packet.ciphertext, packet.auth_tag, aad);
    if (payload.is_error()) {
        return reject(file_key.value(), packet.sequence_index, payload.error());
    }

    auto outcome = ledger_.accept(file_key.value(), packet.sequence_index, payload.value());
    if (outcome.is_error()) {
        spdlog::error("Recording chunk {} of {}: {}",
                      packet.sequence_index, file_key.value(), outcome.error().message);
        return error_for(outcome.error());
    }

    if (auto moved = sessions_.mark_receiving(packet.session_id); moved.is_error()) {
        spdlog::warn("Session {}: {}", packet.session_id, moved.error().message);
    }

    transfer::ChunkAck ack;
    ack.file_key = file_key.value();
    ack.client_file_name = packet.file_name;
    ack.chunk_index = packet.sequence_index;
    ack.already_received = outcome.value() == transfer::AcceptOutcome::Duplicate;
    return protocol::json_response(HttpStatus::OK, protocol::ack_to_json(ack));
}

HttpResponse UploadService::handle_status(const HttpContext& ctx) const {
    auto filename = filename_param(ctx);
    if (filename.is_error()) {
        return error_for(filename.error());
    }
    auto file_key = stored_name(filename.value());
    if (file_key.is_error()) {
        return error_for(file_key.error());
    }

    auto received = ledger_.status_of(file_key.value());
    if (received.is_error()) {
        spdlog::error("Status of {}: {}", file_key.value(), received.error().message);
        return error_for(received.error());
    }

    return protocol::json_response(HttpStatus::OK, json{
        {"filename", file_key.value()},
        {"receivedChunks", received.value()},
    });
}

HttpResponse UploadService::handle_complete(const HttpContext& ctx) {
    auto body = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return protocol::error_response(HttpStatus::BAD_REQUEST, "Invalid JSON");
    }
    if (!body.contains("filename") || !body["filename"].is_string()) {
        return protocol::error_response(HttpStatus::BAD_REQUEST, "filename required");
    }
    if (!body.contains("totalChunks") || !body["totalChunks"].is_number_unsigned()) {
        return protocol::error_response(HttpStatus::BAD_REQUEST, "totalChunks required");
    }
    const auto requested_total = body["totalChunks"].get<std::uint64_t>();
    if (requested_total > std::numeric_limits<std::uint32_t>::max()) {
        return protocol::error_response(HttpStatus::BAD_REQUEST, "totalChunks out of range");
    }
    const auto total = static_cast<std::uint32_t>(requested_total);

    auto file_key = stored_name(body["filename"].get<std::string>());
    if (file_key.is_error()) {
        return error_for(file_key.error());
    }
    const std::string session_id = body.value("sessionId", std::string{});

    auto finalized = ledger_.finalize(file_key.value(), total);
    if (finalized.is_error()) {
        if (finalized.error().code != ErrorCode::IncompleteTransfer) {
            spdlog::error("Finalizing {}: {}", file_key.value(), finalized.error().message);
            return error_for(finalized.error());
        }

        json conflict{{"error", finalized.error().message}};
        auto missing = ledger_.missing_chunks(file_key.value(), total);
        conflict["missingChunks"] = missing.is_ok() ? json(missing.value()) : json::array();
        spdlog::info("Finalize of {} deferred: {}", file_key.value(), finalized.error().message);
        return protocol::json_response(HttpStatus::CONFLICT, conflict);
    }

    if (!session_id.empty()) {
        if (auto closed = sessions_.close(session_id); closed.is_error()) {
            spdlog::warn("Closing session {}: {}", session_id, closed.error().message);
        }
    }
    if (auto swept = sessions_.close_for_file(file_key.value()); swept.is_error()) {
        spdlog::warn("Closing sessions of {}: {}", file_key.value(), swept.error().message);
    }

    return protocol::json_response(HttpStatus::OK, protocol::finalized_to_json(finalized.value()));
}

HttpResponse UploadService::handle_delete(const HttpContext& ctx) {
    auto filename = filename_param(ctx);
    if (filename.is_error()) {
        return error_for(filename.error());
    }
    auto file_key = stored_name(filename.value());
    if (file_key.is_error()) {
        return error_for(file_key.error());
    }

    if (auto cleaned = ledger_.cleanup(file_key.value()); cleaned.is_error()) {
        spdlog::error("Cleaning up {}: {}", file_key.value(), cleaned.error().message);
        return error_for(cleaned.error());
    }
    if (auto swept = sessions_.close_for_file(file_key.value(), transfer::SessionState::Failed); swept.is_error()) {
        spdlog::error("Closing sessions of {}: {}", file_key.value(), swept.error().message);
        return error_for(swept.error());
    }

    spdlog::info("Forgot chunk records of {}", file_key.value());
    return protocol::json_response(HttpStatus::OK, json{
        {"filename", file_key.value()},
        {"removed", true},
    });
}

HttpResponse UploadService::reject(const std::string& file_key,
                                   std::uint32_t chunk_index,
                                   const Error& error) {
    spdlog::warn("Rejected chunk {} of '{}': {}", chunk_index, file_key, error.describe());
    if (bus_) {
        bus_->emit(events::ChunkRejectedEvent{file_key, chunk_index, error.message});
    }
    return error_for(error);
}

} // namespace ixcp::server
