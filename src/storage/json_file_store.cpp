#include "ixcp/storage/json_file_store.hpp"

#include "ixcp/core/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace ixcp::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

void apply_op(std::unordered_map<std::string, std::map<std::string, Value>>& tables,
              const WriteBatch::Op& op) {
    if (op.type == WriteBatch::OpType::Put) {
        tables[op.table][op.key] = op.value;
        return;
    }
    auto it = tables.find(op.table);
    if (it != tables.end()) {
        it->second.erase(op.key);
    }
}

} // namespace

JsonFileStore::JsonFileStore(fs::path path) : path_(std::move(path)) {}

Result<std::unique_ptr<JsonFileStore>> JsonFileStore::open(const fs::path& path) {
    std::unique_ptr<JsonFileStore> store(new JsonFileStore(path));

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec && !fs::exists(path.parent_path())) {
            return Err<std::unique_ptr<JsonFileStore>>(ErrorCode::IoFailure,
                "Failed to create directory: " + path.parent_path().string());
        }
    }

    if (auto loaded = store->load(); loaded.is_error()) {
        return Err<std::unique_ptr<JsonFileStore>>(loaded.error());
    }
    spdlog::debug("JSON store opened: {}", path.string());
    return Ok(std::move(store));
}

Result<void> JsonFileStore::load() {
    if (!fs::exists(path_)) {
        return Ok();
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::IoFailure, "Failed to open store file: " + path_.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<void>(ErrorCode::StorageFailure, "Corrupt store file: " + path_.string());
    }
    if (document.value("version", 0) != kFormatVersion) {
        return Err<void>(ErrorCode::StorageFailure, "Unsupported store file version: " + path_.string());
    }

    Tables tables;
    const json table_docs = document.value("tables", json::object());
    for (const auto& [table, rows] : table_docs.items()) {
        if (!rows.is_object()) {
            return Err<void>(ErrorCode::StorageFailure, "Corrupt table '" + table + "' in " + path_.string());
        }
        auto& target = tables[table];
        for (const auto& [key, encoded] : rows.items()) {
            if (!encoded.is_string()) {
                return Err<void>(ErrorCode::StorageFailure, "Corrupt value in table '" + table + "'");
            }
            auto decoded = base64_decode(encoded.get<std::string>());
            if (decoded.is_error()) {
                return Err<void>(ErrorCode::StorageFailure, "Corrupt value in table '" + table + "'");
            }
            target.emplace(key, ixcp::to_string(decoded.value()));
        }
    }

    tables_ = std::move(tables);
    return Ok();
}

Result<void> JsonFileStore::persist(const Tables& tables) const {
    json document;
    document["version"] = kFormatVersion;
    document["tables"] = json::object();
    for (const auto& [table, rows] : tables) {
        json encoded_rows = json::object();
        for (const auto& [key, value] : rows) {
            encoded_rows[key] = base64_encode(to_bytes(value));
        }
        document["tables"][table] = std::move(encoded_rows);
    }

    fs::path temp_path = path_;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::IoFailure, "Failed to open " + temp_path.string());
        }
        output << document.dump();
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::IoFailure, "Failed to write " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoFailure, "Failed to replace store file: " + ec.message());
    }
    return Ok();
}

Result<void> JsonFileStore::commit(Tables next) {
    if (auto written = persist(next); written.is_error()) {
        return written;
    }
    tables_ = std::move(next);
    return Ok();
}

Result<void> JsonFileStore::put(const std::string& table, const std::string& key, const Value& value) {
    WriteBatch batch;
    batch.put(table, key, value);
    return apply(batch);
}

Result<std::optional<Value>> JsonFileStore::get(const std::string& table, const std::string& key) const {
    std::lock_guard lock(mutex_);
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

Result<void> JsonFileStore::remove(const std::string& table, const std::string& key) {
    WriteBatch batch;
    batch.remove(table, key);
    return apply(batch);
}

Result<std::vector<Entry>> JsonFileStore::scan(const std::string& table, const std::string& prefix) const {
    std::lock_guard lock(mutex_);
    std::vector<Entry> result;
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return Ok(std::move(result));
    }
    for (auto it = table_it->second.lower_bound(prefix); it != table_it->second.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        result.emplace_back(it->first, it->second);
    }
    return Ok(std::move(result));
}

Result<void> JsonFileStore::apply(const WriteBatch& batch) {
    std::lock_guard lock(mutex_);
    Tables next = tables_;
    for (const auto& op : batch.ops()) {
        apply_op(next, op);
    }
    return commit(std::move(next));
}

Result<void> JsonFileStore::clear(const std::string& table) {
    std::lock_guard lock(mutex_);
    if (tables_.find(table) == tables_.end()) {
        return Ok();
    }
    Tables next = tables_;
    next.erase(table);
    return commit(std::move(next));
}

} // namespace ixcp::storage
