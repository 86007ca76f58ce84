#pragma once

#include "ixcp/events/event_bus.hpp"
#include "ixcp/network/http_router.hpp"
#include "ixcp/server/key_ring.hpp"
#include "ixcp/storage/kv_store.hpp"
#include "ixcp/transfer/chunk_ledger.hpp"
#include "ixcp/transfer/session.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace ixcp::server {

/**
 * @brief Receiver side of the upload protocol
 *
 * Owns the chunk ledger and the session manager, and exposes them as HTTP
 * routes:
 *
 *   GET    /public-key                 current receiver key (no auth)
 *   POST   /upload                     one encrypted chunk
 *   GET    /upload/status?filename=    indices already received
 *   POST   /upload/complete            assemble the file
 *   DELETE /upload?filename=           forget a file
 *
 * Every route but /public-key requires "Authorization: Bearer <api key>".
 * All responses carry permissive CORS headers.
 *
 * A chunk is committed to the ledger only after its AEAD tag verifies
 * against the session key and the (session id, file key) associated data.
 * The associated data always uses the client's file key; the ledger and
 * the output directory use the stored name chosen by the FileNamer.
 */
class UploadService {
public:
    /**
     * @brief Maps a client file key (the sanitized basename) to the stored name
     *
     * Called for every upload, status, complete and delete request, so it
     * must return the same name for the same key. The result must itself
     * be a valid file key.
     */
    using FileNamer = std::function<Result<std::string>(const std::string& file_key)>;

    UploadService(storage::KeyValueStore& store,
                  const KeyRing& keys,
                  std::filesystem::path output_dir,
                  std::string api_key,
                  events::EventBus* bus = nullptr);

    /// Replaces the default naming (the file key unchanged). Set before serving.
    void set_file_namer(FileNamer namer);

    /// Stored name for a client-supplied file name.
    Result<std::string> stored_name(const std::string& client_name) const;

    /// Adds the routes, auth middleware and CORS filter to @p router.
    void register_routes(network::HttpRouter& router);

    network::HttpResponse handle_public_key(const network::HttpContext& ctx) const;
    network::HttpResponse handle_upload(const network::HttpContext& ctx);
    network::HttpResponse handle_status(const network::HttpContext& ctx) const;
    network::HttpResponse handle_complete(const network::HttpContext& ctx);
    network::HttpResponse handle_delete(const network::HttpContext& ctx);

    /// False (and a 401 in @p response) unless the bearer token matches.
    bool authorize(const network::HttpContext& ctx, network::HttpResponse& response) const;

    static network::HttpStatus status_for(ErrorCode code) noexcept;

    transfer::ChunkLedger& ledger() noexcept { return ledger_; }
    transfer::TransferSessionManager& sessions() noexcept { return sessions_; }

private:
    network::HttpResponse reject(const std::string& file_key,
                                 std::uint32_t chunk_index,
                                 const Error& error);

    const KeyRing& keys_;
    std::string api_key_;
    events::EventBus* bus_;
    FileNamer namer_;
    transfer::ChunkLedger ledger_;
    transfer::TransferSessionManager sessions_;
};

} // namespace ixcp::server
