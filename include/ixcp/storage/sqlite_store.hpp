#pragma once

#include "ixcp/storage/kv_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

struct sqlite3;

namespace ixcp::storage {

/**
 * @brief KeyValueStore backed by an embedded SQLite database
 *
 * Schema: kv(tbl TEXT, key BLOB, value BLOB, PRIMARY KEY(tbl, key)).
 * The journal runs in WAL mode with synchronous=FULL, and every WriteBatch
 * is executed inside BEGIN IMMEDIATE ... COMMIT, rolled back on the first
 * failing statement.
 */
class SqliteStore : public KeyValueStore {
public:
    static Result<std::unique_ptr<SqliteStore>> open(const std::filesystem::path& path);

    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    Result<void> put(const std::string& table, const std::string& key, const Value& value) override;
    Result<std::optional<Value>> get(const std::string& table, const std::string& key) const override;
    Result<void> remove(const std::string& table, const std::string& key) override;
    Result<std::vector<Entry>> scan(const std::string& table, const std::string& prefix) const override;
    Result<void> apply(const WriteBatch& batch) override;
    Result<void> clear(const std::string& table) override;

    const char* backend_name() const noexcept override { return "sqlite"; }

private:
    SqliteStore(sqlite3* db, std::filesystem::path path);

    Result<void> exec(const char* sql) const;
    Result<void> run_op(const WriteBatch::Op& op);

    sqlite3* db_;
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace ixcp::storage
