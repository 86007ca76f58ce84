#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/crypto/key_cache.hpp"
#include "ixcp/transfer/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ixcp::transfer {

/**
 * @brief Client view of the receiver
 *
 * Implementations classify every failure with an ErrorCode:
 * TransientTransport for anything worth retrying (connection errors,
 * timeouts, 5xx), AuthenticationRejected for a refused API key,
 * PayloadRejected for a refused packet, IncompleteTransfer when finalize
 * finds chunks missing.
 *
 * upload_chunk() may be called from several threads at once when the
 * orchestrator runs more than one chunk in flight.
 */
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual Result<crypto::PublicKeyRecord> fetch_public_key() = 0;

    virtual Result<ChunkAck> upload_chunk(const EncryptedPacket& packet) = 0;

    /// Indices the receiver already holds for @p file_key.
    virtual Result<std::vector<std::uint32_t>> query_status(const std::string& file_key) = 0;

    virtual Result<FinalizedFile> finalize(const std::string& file_key,
                                           std::uint32_t total_chunks,
                                           const std::string& session_id) = 0;

    /// Make the receiver forget @p file_key: chunks, completion record and sessions.
    virtual Result<void> discard(const std::string& file_key) = 0;
};

} // namespace ixcp::transfer
