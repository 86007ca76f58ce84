#pragma once

/**
 * @file config.hpp
 * @brief Client and receiver configuration
 *
 * Precedence, lowest first: built-in defaults, the JSON file named by
 * IXCP_CONFIG, environment variables. Environment access goes through an
 * EnvLookup so tests can supply their own variables.
 */

#include "ixcp/core/result.hpp"
#include "ixcp/storage/store_factory.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ixcp {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

struct ClientConfig {
    std::string api_key;
    std::string server_url = "http://127.0.0.1:3000";
    std::filesystem::path data_dir;
    storage::StorageMode storage_mode = storage::StorageMode::Sqlite;
    std::size_t chunk_size = 1024 * 1024;
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_retry_delay{1000};
    std::chrono::milliseconds request_timeout{30000};
    std::size_t max_in_flight = 1;
    std::chrono::seconds key_cache_ttl{3600};
    std::string log_level = "info";
};

struct ServerConfig {
    std::uint16_t port = 3000;
    std::string api_key;
    bool api_key_generated = false;  // no key configured, one was generated
    std::filesystem::path output_dir = "uploads";
    std::filesystem::path data_dir = "ixcp-data";
    storage::StorageMode storage_mode = storage::StorageMode::Sqlite;
    std::filesystem::path key_file;  // defaults to <data_dir>/receiver_key.pem
    int rsa_bits = 2048;
    std::string log_level = "info";
};

Result<ClientConfig> load_client_config(const EnvLookup& env = process_env);
Result<ServerConfig> load_server_config(const EnvLookup& env = process_env);

} // namespace ixcp
