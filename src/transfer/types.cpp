#include "ixcp/transfer/types.hpp"

#include "ixcp/storage/kv_store.hpp"

namespace ixcp::transfer {

const char* to_string(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending:  return "pending";
        case ChunkStatus::Uploaded: return "uploaded";
    }
    return "unknown";
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Open:      return "open";
        case SessionState::Receiving: return "receiving";
        case SessionState::Finalized: return "finalized";
        case SessionState::Failed:    return "failed";
    }
    return "unknown";
}

std::string ChunkId::key() const {
    return storage::composite_key(file_id, sequence_index);
}

std::string EncryptedPacket::id() const {
    return session_id + ":" + std::to_string(sequence_index);
}

} // namespace ixcp::transfer
