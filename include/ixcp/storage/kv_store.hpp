#pragma once

/**
 * @file kv_store.hpp
 * @brief Durable keyed storage used by the chunk buffer and the ledger
 *
 * Values are opaque byte strings grouped into named tables. Keys inside a
 * table are ordered, so a prefix scan over a composite key returns entries
 * sorted by the trailing component.
 *
 * Atomicity: a WriteBatch is applied all-or-nothing. Callers that need two
 * records to appear together (chunk metadata + payload, ledger entry +
 * payload) put both into the same batch.
 */

#include "ixcp/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ixcp::storage {

using Value = std::string;
using Entry = std::pair<std::string, Value>;

/**
 * @brief Ordered list of puts and deletes committed as one unit
 */
class WriteBatch {
public:
    enum class OpType { Put, Delete };

    struct Op {
        OpType type;
        std::string table;
        std::string key;
        Value value;
    };

    void put(std::string table, std::string key, Value value) {
        ops_.push_back({OpType::Put, std::move(table), std::move(key), std::move(value)});
    }

    void remove(std::string table, std::string key) {
        ops_.push_back({OpType::Delete, std::move(table), std::move(key), {}});
    }

    const std::vector<Op>& ops() const noexcept { return ops_; }
    bool empty() const noexcept { return ops_.empty(); }
    std::size_t size() const noexcept { return ops_.size(); }

private:
    std::vector<Op> ops_;
};

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual Result<void> put(const std::string& table, const std::string& key, const Value& value) = 0;

    /// Returns std::nullopt when the key is absent; errors only on backend failure.
    virtual Result<std::optional<Value>> get(const std::string& table, const std::string& key) const = 0;

    /// Removing an absent key is not an error.
    virtual Result<void> remove(const std::string& table, const std::string& key) = 0;

    /// All entries of @p table whose key starts with @p prefix, in key order.
    virtual Result<std::vector<Entry>> scan(const std::string& table, const std::string& prefix) const = 0;

    virtual Result<void> apply(const WriteBatch& batch) = 0;

    virtual Result<void> clear(const std::string& table) = 0;

    /// Backend name for logs ("memory", "json", "sqlite").
    virtual const char* backend_name() const noexcept = 0;
};

// ────────────────────────────────────────────────────────────
// Composite keys
// ────────────────────────────────────────────────────────────

/// Separator between key components; identifiers may not contain it.
inline constexpr char kKeySeparator = '\x1f';

bool is_valid_key_component(std::string_view component) noexcept;

/// "<owner>\x1f" - prefix matching every index stored for @p owner.
std::string key_prefix(const std::string& owner);

/// "<owner>\x1f<index, 10 zero-padded digits>"
std::string composite_key(const std::string& owner, std::uint32_t index);

/// Inverse of composite_key(); fails on keys that were not built by it.
Result<std::pair<std::string, std::uint32_t>> split_composite_key(const std::string& key);

} // namespace ixcp::storage
