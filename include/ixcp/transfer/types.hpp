#pragma once

#include "ixcp/core/encoding.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace ixcp::transfer {

// ════════════════════════════════════════════════════════
// Client side
// ════════════════════════════════════════════════════════

enum class ChunkStatus {
    Pending,
    Uploaded
};

const char* to_string(ChunkStatus status) noexcept;

/**
 * @brief Buffer address of a chunk
 *
 * Encoded as the composite store key "<file_id>\x1f<index>".
 */
struct ChunkId {
    std::string file_id;
    std::uint32_t sequence_index = 0;

    std::string key() const;

    bool operator==(const ChunkId& other) const {
        return file_id == other.file_id && sequence_index == other.sequence_index;
    }
};

/**
 * @brief One buffered slice of a file
 *
 * For a file of N chunks the indices are exactly [0, N), assigned once when
 * the file is split. status only moves Pending → Uploaded, except through
 * ChunkBuffer::reset().
 */
struct Chunk {
    ChunkId id;
    Bytes payload;
    ChunkStatus status = ChunkStatus::Pending;

    const std::string& file_id() const noexcept { return id.file_id; }
    std::uint32_t sequence_index() const noexcept { return id.sequence_index; }
};

/**
 * @brief Written with the chunks of a file so the total is known later
 */
struct FileManifest {
    std::string file_id;
    std::uint32_t total_chunks = 0;
    std::uint64_t total_bytes = 0;
};

enum class PacketStatus {
    Pending,
    Sent,
    Acknowledged
};

/**
 * @brief One encrypted chunk as it travels to the receiver
 *
 * The nonce depends only on sequence_index, so resending the same chunk
 * under the same session key reproduces this packet byte for byte.
 */
struct EncryptedPacket {
    std::string session_id;
    std::string file_name;      // client file name, X-File-Name
    std::uint32_t sequence_index = 0;
    std::string key_id;
    Bytes wrapped_key;
    Bytes nonce;
    Bytes auth_tag;
    Bytes ciphertext;
    PacketStatus status = PacketStatus::Pending;

    /// "<session_id>:<sequence_index>"
    std::string id() const;
};

// ════════════════════════════════════════════════════════
// Receiver side
// ════════════════════════════════════════════════════════

struct ReceivedChunkRecord {
    std::string file_key;
    std::uint32_t chunk_index = 0;
};

enum class AcceptOutcome {
    Accepted,
    Duplicate
};

/**
 * @brief Result of ChunkLedger::finalize()
 */
struct FinalizedFile {
    std::string file_key;
    std::uint32_t chunk_count = 0;
    std::uint64_t total_bytes = 0;
    std::string sha256;
};

/**
 * @brief Acknowledgement returned to the client for one packet
 */
struct ChunkAck {
    std::string file_key;
    std::string client_file_name;
    std::uint32_t chunk_index = 0;
    bool already_received = false;
};

enum class SessionState {
    Open,
    Receiving,
    Finalized,
    Failed
};

const char* to_string(SessionState state) noexcept;

/**
 * @brief Persisted part of a receiver session
 *
 * Only the wrapped key is stored; the plaintext key is rebuilt from it.
 */
struct TransferSessionInfo {
    std::string session_id;
    std::string key_id;
    Bytes wrapped_key;
    std::chrono::system_clock::time_point created_at{};
    SessionState state = SessionState::Open;
    std::string last_error;  ///< Populated when state == Failed
    std::set<std::string> file_keys;  ///< Files this session delivered chunks for
};

} // namespace ixcp::transfer
