/**
 * @file events.hpp
 * @brief Events emitted by the receiver while chunks flow in
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkAcceptedEvent, TransferFinalizedEvent.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ixcp::events {

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

/**
 * @brief A chunk was decrypted and committed to the ledger for the first time
 *
 * WHO EMITS: ChunkLedger::accept()
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ChunkAcceptedEvent {
    std::string file_key;
    std::uint32_t chunk_index = 0;
    std::size_t bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A chunk that was already recorded arrived again (client retry)
 */
struct ChunkDuplicateEvent {
    std::string file_key;
    std::uint32_t chunk_index = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A packet was refused before reaching the ledger
 *
 * WHO EMITS: UploadService (bad headers, tag mismatch, unwrap failure)
 */
struct ChunkRejectedEvent {
    std::string file_key;
    std::uint32_t chunk_index = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Session / Transfer Events
// ════════════════════════════════════════════════════════

struct SessionOpenedEvent {
    std::string session_id;
    std::string key_id;
    bool restored = false;  // rebuilt from a persisted wrapped key
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionClosedEvent {
    std::string session_id;
    std::string state;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferFinalizedEvent {
    std::string file_key;
    std::uint32_t chunk_count = 0;
    std::uint64_t total_bytes = 0;
    std::string sha256;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    uint16_t port;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerStartedEvent(uint16_t p)
        : port(p),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace ixcp::events
