#pragma once

#include "ixcp/core/result.hpp"
#include "ixcp/events/event_bus.hpp"
#include "ixcp/storage/kv_store.hpp"
#include "ixcp/transfer/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace ixcp::transfer {

/**
 * @brief Receiver's durable record of accepted chunks
 *
 * STORAGE LAYOUT:
 *   ledger           <file_key>\x1f<index>  → {"size": n, "receivedAt": ms}
 *   ledger_payloads  <file_key>\x1f<index>  → decrypted payload
 *   completed        <file_key>             → FinalizedFile as JSON
 *
 * Ledger entry and payload go into one WriteBatch. accept() is serialized
 * by a mutex, so two concurrent deliveries of the same chunk produce one
 * Accepted and one Duplicate.
 */
class ChunkLedger {
public:
    static constexpr const char* kLedgerTable = "ledger";
    static constexpr const char* kPayloadsTable = "ledger_payloads";
    static constexpr const char* kCompletedTable = "completed";

    ChunkLedger(storage::KeyValueStore& store,
                std::filesystem::path output_dir,
                events::EventBus* bus = nullptr);

    /**
     * @brief Ledger key for a client-supplied file name
     *
     * The basename of @p client_name ('/' and '\\' both separate). Empty
     * names, "." and "..", and names containing 0x1F are InvalidArgument.
     */
    static Result<std::string> file_key_for(const std::string& client_name);

    /// Accepted on first delivery, Duplicate (no write) afterwards.
    Result<AcceptOutcome> accept(const std::string& file_key,
                                 std::uint32_t chunk_index,
                                 const Bytes& payload);

    /// Received indices, ascending.
    Result<std::vector<std::uint32_t>> status_of(const std::string& file_key) const;

    /// Indices in [0, expected_count) not yet recorded.
    Result<std::vector<std::uint32_t>> missing_chunks(const std::string& file_key,
                                                      std::uint32_t expected_count) const;

    /**
     * @brief Assemble the file once every index is present
     *
     * IncompleteTransfer unless the recorded set is exactly
     * {0, ..., expected_count - 1}. On success the payloads are written in
     * index order to output_dir/<file_key> through a staging file and a
     * rename, and a completion record is stored. Finalizing an already
     * completed file with the same count returns the stored record.
     */
    Result<FinalizedFile> finalize(const std::string& file_key, std::uint32_t expected_count);

    Result<std::optional<FinalizedFile>> completion(const std::string& file_key) const;

    /// Drop ledger entries, payloads and the completion record of @p file_key.
    Result<void> cleanup(const std::string& file_key);

    const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

private:
    Result<std::vector<std::uint32_t>> indices_unlocked(const std::string& file_key) const;
    Result<std::optional<FinalizedFile>> completion_unlocked(const std::string& file_key) const;
    Result<FinalizedFile> assemble(const std::string& file_key, std::uint32_t count);

    storage::KeyValueStore& store_;
    std::filesystem::path output_dir_;
    events::EventBus* bus_;
    mutable std::mutex mutex_;
};

} // namespace ixcp::transfer
