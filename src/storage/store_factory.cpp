#include "ixcp/storage/store_factory.hpp"

#include "ixcp/storage/json_file_store.hpp"
#include "ixcp/storage/memory_store.hpp"
#include "ixcp/storage/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ixcp::storage {

const char* to_string(StorageMode mode) noexcept {
    switch (mode) {
        case StorageMode::Sqlite: return "sqlite";
        case StorageMode::Json:   return "json";
        case StorageMode::Memory: return "memory";
    }
    return "unknown";
}

Result<StorageMode> parse_storage_mode(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sqlite") return Ok(StorageMode::Sqlite);
    if (lower == "json")   return Ok(StorageMode::Json);
    if (lower == "memory") return Ok(StorageMode::Memory);

    return Err<StorageMode>(ErrorCode::InvalidArgument, "Unknown storage mode: " + std::string(text));
}

Result<std::unique_ptr<KeyValueStore>> open_store(StorageMode mode,
                                                  const std::filesystem::path& data_dir,
                                                  const std::string& name) {
    using StorePtr = std::unique_ptr<KeyValueStore>;

    if (name.empty()) {
        return Err<StorePtr>(ErrorCode::InvalidArgument, "Store name must not be empty");
    }

    switch (mode) {
        case StorageMode::Memory:
            spdlog::debug("Opening in-memory store '{}'", name);
            return Ok(StorePtr(std::make_unique<MemoryStore>()));

        case StorageMode::Json: {
            auto store = JsonFileStore::open(data_dir / (name + ".json"));
            if (store.is_error()) {
                return Err<StorePtr>(store.error());
            }
            return Ok(StorePtr(std::move(store.value())));
        }

        case StorageMode::Sqlite: {
            auto store = SqliteStore::open(data_dir / (name + ".db"));
            if (store.is_error()) {
                return Err<StorePtr>(store.error());
            }
            return Ok(StorePtr(std::move(store.value())));
        }
    }
    return Err<StorePtr>(ErrorCode::InvalidArgument, "Unsupported storage mode");
}

} // namespace ixcp::storage
