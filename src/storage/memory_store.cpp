#include "ixcp/storage/memory_store.hpp"

#include <mutex>

namespace ixcp::storage {

Result<void> MemoryStore::put(const std::string& table, const std::string& key, const Value& value) {
    std::unique_lock lock(mutex_);
    tables_[table][key] = value;
    return Ok();
}

Result<std::optional<Value>> MemoryStore::get(const std::string& table, const std::string& key) const {
    std::shared_lock lock(mutex_);

    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return Ok(std::optional<Value>{});
    }
    auto it = table_it->second.find(key);
    if (it == table_it->second.end()) {
        return Ok(std::optional<Value>{});
    }
    return Ok(std::optional<Value>{it->second});
}

Result<void> MemoryStore::remove(const std::string& table, const std::string& key) {
    std::unique_lock lock(mutex_);

    auto table_it = tables_.find(table);
    if (table_it != tables_.end()) {
        table_it->second.erase(key);
    }
    return Ok();
}

Result<std::vector<Entry>> MemoryStore::scan(const std::string& table, const std::string& prefix) const {
    std::shared_lock lock(mutex_);

    std::vector<Entry> result;
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return Ok(std::move(result));
    }

    const auto& rows = table_it->second;
    for (auto it = rows.lower_bound(prefix); it != rows.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        result.emplace_back(it->first, it->second);
    }
    return Ok(std::move(result));
}

Result<void> MemoryStore::apply(const WriteBatch& batch) {
    std::unique_lock lock(mutex_);  // Whole batch under one exclusive lock

    for (const auto& op : batch.ops()) {
        if (op.type == WriteBatch::OpType::Put) {
            tables_[op.table][op.key] = op.value;
        } else {
            auto table_it = tables_.find(op.table);
            if (table_it != tables_.end()) {
                table_it->second.erase(op.key);
            }
        }
    }
    return Ok();
}

Result<void> MemoryStore::clear(const std::string& table) {
    std::unique_lock lock(mutex_);
    tables_.erase(table);
    return Ok();
}

std::size_t MemoryStore::size(const std::string& table) const {
    std::shared_lock lock(mutex_);
    auto table_it = tables_.find(table);
    return table_it == tables_.end() ? 0 : table_it->second.size();
}

} // namespace ixcp::storage
