#pragma once

#include "ixcp/storage/kv_store.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ixcp::storage {

/**
 * @brief KeyValueStore persisted as a single JSON document
 *
 * Every mutation rewrites the document into "<path>.tmp" and renames it over
 * "<path>", so a crash leaves either the old or the new document on disk.
 * The in-memory copy is only updated after the rename succeeded.
 *
 * Suited to small buffers; large payload volumes belong in SqliteStore.
 */
class JsonFileStore : public KeyValueStore {
public:
    static Result<std::unique_ptr<JsonFileStore>> open(const std::filesystem::path& path);

    Result<void> put(const std::string& table, const std::string& key, const Value& value) override;
    Result<std::optional<Value>> get(const std::string& table, const std::string& key) const override;
    Result<void> remove(const std::string& table, const std::string& key) override;
    Result<std::vector<Entry>> scan(const std::string& table, const std::string& prefix) const override;
    Result<void> apply(const WriteBatch& batch) override;
    Result<void> clear(const std::string& table) override;

    const char* backend_name() const noexcept override { return "json"; }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    using Tables = std::unordered_map<std::string, std::map<std::string, Value>>;

    explicit JsonFileStore(std::filesystem::path path);

    Result<void> load();
    Result<void> persist(const Tables& tables) const;
    Result<void> commit(Tables next);

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    Tables tables_;
};

} // namespace ixcp::storage
