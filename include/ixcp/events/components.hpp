/**
 * @file components.hpp
 * @brief Observers attached to the receiver's EventBus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "ixcp/events/event_bus.hpp"
#include "ixcp/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace ixcp::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Per-chunk events go to debug so a large upload does not flood the log at
 * the default level.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
            spdlog::debug("[ChunkAccepted] file={} chunk={} bytes={}", e.file_key, e.chunk_index, e.bytes);
        });

        bus_.subscribe<ChunkDuplicateEvent>([](const ChunkDuplicateEvent& e) {
            spdlog::debug("[ChunkDuplicate] file={} chunk={}", e.file_key, e.chunk_index);
        });

        bus_.subscribe<ChunkRejectedEvent>([](const ChunkRejectedEvent& e) {
            spdlog::warn("[ChunkRejected] file={} chunk={} reason={}", e.file_key, e.chunk_index, e.reason);
        });

        bus_.subscribe<SessionOpenedEvent>([](const SessionOpenedEvent& e) {
            spdlog::info("[SessionOpened] session={} key={}{}", e.session_id, e.key_id,
                         e.restored ? " (restored)" : "");
        });

        bus_.subscribe<SessionClosedEvent>([](const SessionClosedEvent& e) {
            spdlog::info("[SessionClosed] session={} state={}", e.session_id, e.state);
        });

        bus_.subscribe<TransferFinalizedEvent>([](const TransferFinalizedEvent& e) {
            spdlog::info("[TransferFinalized] file={} chunks={} bytes={} sha256={}",
                         e.file_key, e.chunk_count, e.total_bytes, e.sha256);
        });

        bus_.subscribe<ServerStartedEvent>([](const ServerStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Receiver listening on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ServerShuttingDownEvent>([](const ServerShuttingDownEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Receiver shutting down: {}", e.reason);
            spdlog::info("════════════════════════════════════════════");
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts transfer events for the shutdown summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> chunks_accepted{0};
        std::atomic<uint64_t> bytes_accepted{0};
        std::atomic<uint64_t> chunks_duplicate{0};
        std::atomic<uint64_t> chunks_rejected{0};
        std::atomic<uint64_t> sessions_opened{0};
        std::atomic<uint64_t> files_finalized{0};
        std::atomic<uint64_t> bytes_finalized{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_accepted += e.bytes;
        });

        bus_.subscribe<ChunkDuplicateEvent>([this](const ChunkDuplicateEvent&) {
            stats_.chunks_duplicate++;
        });

        bus_.subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent&) {
            stats_.chunks_rejected++;
        });

        bus_.subscribe<SessionOpenedEvent>([this](const SessionOpenedEvent&) {
            stats_.sessions_opened++;
        });

        bus_.subscribe<TransferFinalizedEvent>([this](const TransferFinalizedEvent& e) {
            stats_.files_finalized++;
            stats_.bytes_finalized += e.total_bytes;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Receiver statistics:");
        spdlog::info("  Chunks accepted:  {}", stats_.chunks_accepted.load());
        spdlog::info("  Bytes accepted:   {}", stats_.bytes_accepted.load());
        spdlog::info("  Duplicates:       {}", stats_.chunks_duplicate.load());
        spdlog::info("  Rejected:         {}", stats_.chunks_rejected.load());
        spdlog::info("  Sessions opened:  {}", stats_.sessions_opened.load());
        spdlog::info("  Files finalized:  {}", stats_.files_finalized.load());
        spdlog::info("  Bytes finalized:  {}", stats_.bytes_finalized.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace ixcp::events
