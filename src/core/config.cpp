#include "ixcp/core/config.hpp"

#include "ixcp/core/encoding.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>

namespace ixcp {
namespace {

using json = nlohmann::json;

Result<json> load_config_file(const EnvLookup& env) {
    const auto path = env("IXCP_CONFIG");
    if (!path || path->empty()) {
        return Ok(json::object());
    }

    std::ifstream in(*path);
    if (!in) {
        return Err<json>(ErrorCode::InvalidArgument, "Cannot read config file: " + *path);
    }
    try {
        json document = json::parse(in);
        if (!document.is_object()) {
            return Err<json>(ErrorCode::InvalidArgument, "Config file must hold a JSON object: " + *path);
        }
        return Ok(std::move(document));
    } catch (const json::exception& e) {
        return Err<json>(ErrorCode::InvalidArgument, "Malformed config file " + *path + ": " + e.what());
    }
}

Result<std::uint64_t> parse_unsigned(const std::string& text, const std::string& name) {
    std::uint64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument, name + " must be a non-negative integer, got '" + text + "'");
    }
    return Ok(value);
}

// JSON number or numeric string.
Result<std::uint64_t> json_unsigned(const json& value, const std::string& name) {
    if (value.is_number_unsigned()) {
        return Ok(value.get<std::uint64_t>());
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return Ok(static_cast<std::uint64_t>(value.get<std::int64_t>()));
    }
    if (value.is_string()) {
        return parse_unsigned(value.get<std::string>(), name);
    }
    return Err<std::uint64_t>(ErrorCode::InvalidArgument, name + " must be a non-negative integer");
}

Result<std::string> json_string(const json& value, const std::string& name) {
    if (!value.is_string()) {
        return Err<std::string>(ErrorCode::InvalidArgument, name + " must be a string");
    }
    return Ok(value.get<std::string>());
}

/**
 * @brief Resolves one setting from the config file and then the environment
 *
 * Both sources are optional; the environment wins when both are present.
 */
class Settings {
public:
    Settings(const json& file, const EnvLookup& env) : file_(file), env_(env) {}

    Result<std::optional<std::string>> text(const std::string& key, const std::string& env_name) const {
        if (auto from_env = env_(env_name); from_env && !from_env->empty()) {
            return Ok(std::optional<std::string>(*from_env));
        }
        if (auto it = file_.find(key); it != file_.end()) {
            auto value = json_string(*it, key);
            if (value.is_error()) {
                return Err<std::optional<std::string>>(value.error());
            }
            return Ok(std::optional<std::string>(value.value()));
        }
        return Ok(std::optional<std::string>{});
    }

    Result<std::optional<std::uint64_t>> number(const std::string& key, const std::string& env_name) const {
        if (auto from_env = env_(env_name); from_env && !from_env->empty()) {
            auto value = parse_unsigned(*from_env, env_name);
            if (value.is_error()) {
                return Err<std::optional<std::uint64_t>>(value.error());
            }
            return Ok(std::optional<std::uint64_t>(value.value()));
        }
        if (auto it = file_.find(key); it != file_.end()) {
            auto value = json_unsigned(*it, key);
            if (value.is_error()) {
                return Err<std::optional<std::uint64_t>>(value.error());
            }
            return Ok(std::optional<std::uint64_t>(value.value()));
        }
        return Ok(std::optional<std::uint64_t>{});
    }

    /// Leaves @p target untouched when neither source sets the value.
    Result<void> read_text(const std::string& key, const std::string& env_name, std::string& target) const {
        auto value = text(key, env_name);
        if (value.is_error()) {
            return Err<void>(value.error());
        }
        if (value.value()) {
            target = *value.value();
        }
        return Ok();
    }

    template<typename T>
    Result<void> read_number(const std::string& key, const std::string& env_name, T& target) const {
        auto value = number(key, env_name);
        if (value.is_error()) {
            return Err<void>(value.error());
        }
        if (value.value()) {
            if (*value.value() > std::numeric_limits<T>::max()) {
                return Err<void>(ErrorCode::InvalidArgument, key + " is out of range");
            }
            target = static_cast<T>(*value.value());
        }
        return Ok();
    }

private:
    const json& file_;
    const EnvLookup& env_;
};

/// First failure among settings reads, in order.
Result<void> first_error(std::initializer_list<Result<void>> reads) {
    for (const auto& read : reads) {
        if (read.is_error()) {
            return read;
        }
    }
    return Ok();
}

std::filesystem::path default_client_data_dir(const EnvLookup& env) {
    if (auto home = env("HOME"); home && !home->empty()) {
        return std::filesystem::path(*home) / ".ixcp";
    }
    return ".ixcp";
}

} // namespace

std::optional<std::string> process_env(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

Result<ClientConfig> load_client_config(const EnvLookup& env) {
    auto file = load_config_file(env);
    if (file.is_error()) {
        return Err<ClientConfig>(file.error());
    }
    Settings settings(file.value(), env);

    ClientConfig config;
    config.data_dir = default_client_data_dir(env);

    std::string data_dir;
    std::string storage_mode;
    std::uint64_t retry_delay_ms = config.initial_retry_delay.count();
    std::uint64_t timeout_ms = config.request_timeout.count();
    std::uint64_t ttl_s = config.key_cache_ttl.count();
    std::uint64_t max_attempts = config.max_attempts;

    auto read = first_error({
        settings.read_text("api_key", "IXCP_API_KEY", config.api_key),
        settings.read_text("server_url", "IXCP_SERVER_URL", config.server_url),
        settings.read_text("data_dir", "IXCP_DATA_DIR", data_dir),
        settings.read_text("storage_mode", "IXCP_STORAGE_MODE", storage_mode),
        settings.read_text("log_level", "IXCP_LOG_LEVEL", config.log_level),
        settings.read_number("chunk_size", "IXCP_CHUNK_SIZE", config.chunk_size),
        settings.read_number("max_attempts", "IXCP_MAX_ATTEMPTS", max_attempts),
        settings.read_number("initial_retry_delay_ms", "IXCP_RETRY_DELAY_MS", retry_delay_ms),
        settings.read_number("request_timeout_ms", "IXCP_REQUEST_TIMEOUT_MS", timeout_ms),
        settings.read_number("max_in_flight", "IXCP_MAX_IN_FLIGHT", config.max_in_flight),
        settings.read_number("key_cache_ttl_s", "IXCP_KEY_CACHE_TTL_S", ttl_s),
    });
    if (read.is_error()) {
        return Err<ClientConfig>(read.error());
    }

    if (!data_dir.empty()) {
        config.data_dir = data_dir;
    }
    if (!storage_mode.empty()) {
        auto mode = storage::parse_storage_mode(storage_mode);
        if (mode.is_error()) {
            return Err<ClientConfig>(mode.error());
        }
        config.storage_mode = mode.value();
    }
    if (config.chunk_size == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "chunk_size must be positive");
    }
    if (max_attempts == 0 || max_attempts > std::numeric_limits<std::uint32_t>::max()) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "max_attempts must be at least 1");
    }
    if (config.max_in_flight == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "max_in_flight must be at least 1");
    }
    if (timeout_ms == 0) {
        return Err<ClientConfig>(ErrorCode::InvalidArgument, "request_timeout_ms must be positive");
    }

    config.max_attempts = static_cast<std::uint32_t>(max_attempts);
    config.initial_retry_delay = std::chrono::milliseconds(retry_delay_ms);
    config.request_timeout = std::chrono::milliseconds(timeout_ms);
    config.key_cache_ttl = std::chrono::seconds(ttl_s);
    return Ok(std::move(config));
}

Result<ServerConfig> load_server_config(const EnvLookup& env) {
    auto file = load_config_file(env);
    if (file.is_error()) {
        return Err<ServerConfig>(file.error());
    }
    Settings settings(file.value(), env);

    ServerConfig config;
    std::uint64_t port = config.port;
    std::uint64_t rsa_bits = static_cast<std::uint64_t>(config.rsa_bits);
    std::string output_dir;
    std::string data_dir;
    std::string key_file;
    std::string storage_mode;

    auto read = first_error({
        settings.read_number("port", "IXCP_PORT", port),
        settings.read_text("api_key", "IXCP_API_KEY", config.api_key),
        settings.read_text("output_dir", "IXCP_OUTPUT_DIR", output_dir),
        settings.read_text("data_dir", "IXCP_DATA_DIR", data_dir),
        settings.read_text("storage_mode", "IXCP_STORAGE_MODE", storage_mode),
        settings.read_text("key_file", "IXCP_KEY_FILE", key_file),
        settings.read_number("rsa_bits", "IXCP_RSA_BITS", rsa_bits),
        settings.read_text("log_level", "IXCP_LOG_LEVEL", config.log_level),
    });
    if (read.is_error()) {
        return Err<ServerConfig>(read.error());
    }

    if (port == 0 || port > 65535) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, "port must be between 1 and 65535");
    }
    if (rsa_bits < 2048 || rsa_bits > 16384) {
        return Err<ServerConfig>(ErrorCode::InvalidArgument, "rsa_bits must be between 2048 and 16384");
    }
    config.port = static_cast<std::uint16_t>(port);
    config.rsa_bits = static_cast<int>(rsa_bits);

    if (!output_dir.empty()) config.output_dir = output_dir;
    if (!data_dir.empty()) config.data_dir = data_dir;
    config.key_file = key_file.empty() ? config.data_dir / "receiver_key.pem"
                                       : std::filesystem::path(key_file);

    if (!storage_mode.empty()) {
        auto mode = storage::parse_storage_mode(storage_mode);
        if (mode.is_error()) {
            return Err<ServerConfig>(mode.error());
        }
        config.storage_mode = mode.value();
    }

    if (config.api_key.empty()) {
        auto random = random_bytes(32);
        if (random.is_error()) {
            return Err<ServerConfig>(random.error());
        }
        config.api_key = hex_encode(random.value());
        config.api_key_generated = true;
    }
    return Ok(std::move(config));
}

} // namespace ixcp
