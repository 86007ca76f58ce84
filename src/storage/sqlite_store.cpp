#include "ixcp/storage/sqlite_store.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace ixcp::storage {
namespace fs = std::filesystem;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS kv ("
    "  tbl   TEXT NOT NULL,"
    "  key   BLOB NOT NULL,"
    "  value BLOB NOT NULL,"
    "  PRIMARY KEY (tbl, key)"
    ") WITHOUT ROWID";

/**
 * @brief RAII wrapper for sqlite3_stmt
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }

    void bind_text(int index, const std::string& text) {
        sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }

    void bind_blob(int index, const std::string& data) {
        // zero-length blobs must still bind as blobs, not NULL
        sqlite3_bind_blob(stmt_, index, data.empty() ? "" : data.data(),
                          static_cast<int>(data.size()), SQLITE_TRANSIENT);
    }

    int step() { return sqlite3_step(stmt_); }

    std::string column_blob(int index) const {
        const void* data = sqlite3_column_blob(stmt_, index);
        const int size = sqlite3_column_bytes(stmt_, index);
        if (data == nullptr || size <= 0) {
            return {};
        }
        return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

std::string sqlite_error(sqlite3* db, const std::string& context) {
    return context + ": " + sqlite3_errmsg(db);
}

// Smallest string greater than every string starting with prefix, or empty if none.
std::string prefix_successor(std::string prefix) {
    while (!prefix.empty()) {
        auto& last = reinterpret_cast<unsigned char&>(prefix.back());
        if (last != 0xFF) {
            ++last;
            return prefix;
        }
        prefix.pop_back();
    }
    return prefix;
}

} // namespace

SqliteStore::SqliteStore(sqlite3* db, fs::path path) : db_(db), path_(std::move(path)) {}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

Result<std::unique_ptr<SqliteStore>> SqliteStore::open(const fs::path& path) {
    using StorePtr = std::unique_ptr<SqliteStore>;

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec && !fs::exists(path.parent_path())) {
            return Err<StorePtr>(ErrorCode::IoFailure,
                "Failed to create directory: " + path.parent_path().string());
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    StorePtr store(new SqliteStore(raw, path));
    if (rc != SQLITE_OK) {
        return Err<StorePtr>(ErrorCode::StorageFailure, sqlite_error(raw, "Failed to open " + path.string()));
    }

    sqlite3_busy_timeout(raw, 5000);
    for (const char* sql : {"PRAGMA journal_mode=WAL", "PRAGMA synchronous=FULL", kSchema}) {
        if (auto res = store->exec(sql); res.is_error()) {
            return Err<StorePtr>(res.error());
        }
    }

    spdlog::debug("SQLite store opened: {}", path.string());
    return Ok(std::move(store));
}

Result<void> SqliteStore::exec(const char* sql) const {
    char* message = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string error = message ? message : "unknown sqlite error";
        sqlite3_free(message);
        return Err<void>(ErrorCode::StorageFailure, std::string(sql) + ": " + error);
    }
    return Ok();
}

Result<void> SqliteStore::run_op(const WriteBatch::Op& op) {
    if (op.type == WriteBatch::OpType::Put) {
        Statement stmt(db_, "INSERT OR REPLACE INTO kv (tbl, key, value) VALUES (?, ?, ?)");
        if (!stmt.ok()) {
            return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "prepare put"));
        }
        stmt.bind_text(1, op.table);
        stmt.bind_blob(2, op.key);
        stmt.bind_blob(3, op.value);
        if (stmt.step() != SQLITE_DONE) {
            return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "put"));
        }
        return Ok();
    }

    Statement stmt(db_, "DELETE FROM kv WHERE tbl = ? AND key = ?");
    if (!stmt.ok()) {
        return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "prepare delete"));
    }
    stmt.bind_text(1, op.table);
    stmt.bind_blob(2, op.key);
    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "delete"));
    }
    return Ok();
}

Result<void> SqliteStore::put(const std::string& table, const std::string& key, const Value& value) {
    WriteBatch batch;
    batch.put(table, key, value);
    return apply(batch);
}

Result<std::optional<Value>> SqliteStore::get(const std::string& table, const std::string& key) const {
    std::lock_guard lock(mutex_);
    Statement stmt(db_, "SELECT value FROM kv WHERE tbl = ? AND key = ?");
    if (!stmt.ok()) {
        return Err<std::optional<Value>>(ErrorCode::StorageFailure, sqlite_error(db_, "prepare get"));
    }
    stmt.bind_text(1, table);
    stmt.bind_blob(2, key);

    const int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return Ok(std::optional<Value>{stmt.column_blob(0)});
    }
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<Value>{});
    }
    return Err<std::optional<Value>>(ErrorCode::StorageFailure, sqlite_error(db_, "get"));
}

Result<void> SqliteStore::remove(const std::string& table, const std::string& key) {
    WriteBatch batch;
    batch.remove(table, key);
    return apply(batch);
}

Result<std::vector<Entry>> SqliteStore::scan(const std::string& table, const std::string& prefix) const {
    std::lock_guard lock(mutex_);

    const std::string upper = prefix_successor(prefix);
    Statement stmt(db_, upper.empty()
        ? "SELECT key, value FROM kv WHERE tbl = ? AND key >= ? ORDER BY key"
        : "SELECT key, value FROM kv WHERE tbl = ? AND key >= ? AND key < ? ORDER BY key");
    if (!stmt.ok()) {
        return Err<std::vector<Entry>>(ErrorCode::StorageFailure, sqlite_error(db_, "prepare scan"));
    }
    stmt.bind_text(1, table);
    stmt.bind_blob(2, prefix);
    if (!upper.empty()) {
        stmt.bind_blob(3, upper);
    }

    std::vector<Entry> result;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        result.emplace_back(stmt.column_blob(0), stmt.column_blob(1));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<Entry>>(ErrorCode::StorageFailure, sqlite_error(db_, "scan"));
    }
    return Ok(std::move(result));
}

Result<void> SqliteStore::apply(const WriteBatch& batch) {
    std::lock_guard lock(mutex_);
    if (batch.empty()) {
        return Ok();
    }

    if (auto begin = exec("BEGIN IMMEDIATE"); begin.is_error()) {
        return begin;
    }
    for (const auto& op : batch.ops()) {
        auto res = run_op(op);
        if (res.is_error()) {
            if (auto rollback = exec("ROLLBACK"); rollback.is_error()) {
                spdlog::error("SQLite rollback failed: {}", rollback.error().message);
            }
            return res;
        }
    }
    if (auto commit = exec("COMMIT"); commit.is_error()) {
        if (auto rollback = exec("ROLLBACK"); rollback.is_error()) {
            spdlog::error("SQLite rollback failed: {}", rollback.error().message);
        }
        return commit;
    }
    return Ok();
}

Result<void> SqliteStore::clear(const std::string& table) {
    std::lock_guard lock(mutex_);
    Statement stmt(db_, "DELETE FROM kv WHERE tbl = ?");
    if (!stmt.ok()) {
        return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "prepare clear"));
    }
    stmt.bind_text(1, table);
    if (stmt.step() != SQLITE_DONE) {
        return Err<void>(ErrorCode::StorageFailure, sqlite_error(db_, "clear"));
    }
    return Ok();
}

} // namespace ixcp::storage
