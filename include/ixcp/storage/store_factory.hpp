#pragma once

#include "ixcp/storage/kv_store.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace ixcp::storage {

enum class StorageMode {
    Sqlite,
    Json,
    Memory
};

const char* to_string(StorageMode mode) noexcept;

/// Accepts "sqlite", "json" and "memory" (case-insensitive).
Result<StorageMode> parse_storage_mode(std::string_view text);

/**
 * @brief Open the store named @p name under @p data_dir
 *
 * Sqlite → <data_dir>/<name>.db, Json → <data_dir>/<name>.json,
 * Memory ignores the directory.
 */
Result<std::unique_ptr<KeyValueStore>> open_store(StorageMode mode,
                                                  const std::filesystem::path& data_dir,
                                                  const std::string& name);

} // namespace ixcp::storage
