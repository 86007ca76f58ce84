#pragma once

/**
 * @file memory_store.hpp
 * @brief In-memory KeyValueStore with thread-safe operations
 *
 * WHY THIS FILE EXISTS:
 * Tests and short-lived clients need a store with the same contract as the
 * durable backends but no files on disk. Nothing survives the process.
 *
 * THREAD SAFETY PATTERN:
 * - Readers (get, scan) take a std::shared_lock and run concurrently
 * - Writers (put, remove, apply, clear) take a std::unique_lock
 * - apply() holds the unique lock for the whole batch, which is what makes
 *   a batch atomic for every other thread
 *
 * EXAMPLE USAGE:
 * MemoryStore store;
 * WriteBatch batch;
 * batch.put("ledger", composite_key("report.pdf", 0), "1");
 * batch.put("ledger_payloads", composite_key("report.pdf", 0), payload);
 * store.apply(batch);   // both records appear together
 */

#include "ixcp/storage/kv_store.hpp"

#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace ixcp::storage {

class MemoryStore : public KeyValueStore {
public:
    MemoryStore() = default;

    Result<void> put(const std::string& table, const std::string& key, const Value& value) override;
    Result<std::optional<Value>> get(const std::string& table, const std::string& key) const override;
    Result<void> remove(const std::string& table, const std::string& key) override;
    Result<std::vector<Entry>> scan(const std::string& table, const std::string& prefix) const override;
    Result<void> apply(const WriteBatch& batch) override;
    Result<void> clear(const std::string& table) override;

    const char* backend_name() const noexcept override { return "memory"; }

    /// Number of keys in @p table (for tests and diagnostics).
    std::size_t size(const std::string& table) const;

private:
    /**
     * Internal storage: table -> (key -> value)
     *
     * WHY std::map for the inner level:
     * scan() must return keys in order so that composite keys come back
     * sorted by chunk index. lower_bound(prefix) gives that for free.
     */
    mutable std::shared_mutex mutex_;  // Reader-writer lock
    std::unordered_map<std::string, std::map<std::string, Value>> tables_;
};

} // namespace ixcp::storage
