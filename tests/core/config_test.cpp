#include "ixcp/core/config.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <map>

using ixcp::ErrorCode;
using ixcp::storage::StorageMode;

namespace {

ixcp::EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST(ConfigTest, ClientDefaults) {
    auto config = ixcp::load_client_config(fake_env({{"HOME", "/home/tester"}}));
    ASSERT_TRUE(config.is_ok());

    const auto& c = config.value();
    EXPECT_EQ(c.server_url, "http://127.0.0.1:3000");
    EXPECT_EQ(c.data_dir, std::filesystem::path("/home/tester/.ixcp"));
    EXPECT_EQ(c.storage_mode, StorageMode::Sqlite);
    EXPECT_EQ(c.chunk_size, 1024u * 1024u);
    EXPECT_EQ(c.max_attempts, 3u);
    EXPECT_EQ(c.initial_retry_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(c.max_in_flight, 1u);
    EXPECT_TRUE(c.api_key.empty());
}

TEST(ConfigTest, ClientEnvironmentOverrides) {
    auto config = ixcp::load_client_config(fake_env({
        {"IXCP_API_KEY", "secret"},
        {"IXCP_SERVER_URL", "http://receiver:8080"},
        {"IXCP_STORAGE_MODE", "json"},
        {"IXCP_CHUNK_SIZE", "4096"},
        {"IXCP_MAX_ATTEMPTS", "5"},
        {"IXCP_RETRY_DELAY_MS", "250"},
        {"IXCP_MAX_IN_FLIGHT", "4"},
    }));
    ASSERT_TRUE(config.is_ok());

    const auto& c = config.value();
    EXPECT_EQ(c.api_key, "secret");
    EXPECT_EQ(c.server_url, "http://receiver:8080");
    EXPECT_EQ(c.storage_mode, StorageMode::Json);
    EXPECT_EQ(c.chunk_size, 4096u);
    EXPECT_EQ(c.max_attempts, 5u);
    EXPECT_EQ(c.initial_retry_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(c.max_in_flight, 4u);
}

TEST(ConfigTest, ClientRejectsBadNumbers) {
    auto config = ixcp::load_client_config(fake_env({{"IXCP_CHUNK_SIZE", "lots"}}));
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);

    EXPECT_TRUE(ixcp::load_client_config(fake_env({{"IXCP_MAX_ATTEMPTS", "0"}})).is_error());
    EXPECT_TRUE(ixcp::load_client_config(fake_env({{"IXCP_STORAGE_MODE", "tape"}})).is_error());
}

TEST(ConfigTest, FileValuesYieldToEnvironment) {
    ixcp::test::TempDir dir("ixcp_config");
    const auto file = dir / "client.json";
    ixcp::test::write_file(file, ixcp::to_bytes(R"({"server_url": "http://from-file:1", "chunk_size": 2048})"));

    auto config = ixcp::load_client_config(fake_env({
        {"IXCP_CONFIG", file.string()},
        {"IXCP_SERVER_URL", "http://from-env:2"},
    }));
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().server_url, "http://from-env:2");
    EXPECT_EQ(config.value().chunk_size, 2048u);
}

TEST(ConfigTest, MalformedConfigFileIsAnError) {
    ixcp::test::TempDir dir("ixcp_config");
    const auto file = dir / "broken.json";
    ixcp::test::write_file(file, ixcp::to_bytes("{not json"));

    auto config = ixcp::load_server_config(fake_env({{"IXCP_CONFIG", file.string()}}));
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, ServerGeneratesApiKeyWhenMissing) {
    auto config = ixcp::load_server_config(fake_env({{"IXCP_DATA_DIR", "/var/lib/ixcp"}}));
    ASSERT_TRUE(config.is_ok());

    const auto& c = config.value();
    EXPECT_TRUE(c.api_key_generated);
    EXPECT_EQ(c.api_key.size(), 64u);
    EXPECT_EQ(c.port, 3000);
    EXPECT_EQ(c.key_file, std::filesystem::path("/var/lib/ixcp/receiver_key.pem"));
}

TEST(ConfigTest, ServerValidatesPortAndKeySize) {
    auto configured = ixcp::load_server_config(fake_env({{"IXCP_API_KEY", "k"}, {"IXCP_PORT", "8443"}}));
    ASSERT_TRUE(configured.is_ok());
    EXPECT_EQ(configured.value().port, 8443);
    EXPECT_FALSE(configured.value().api_key_generated);

    EXPECT_TRUE(ixcp::load_server_config(fake_env({{"IXCP_PORT", "70000"}})).is_error());
    EXPECT_TRUE(ixcp::load_server_config(fake_env({{"IXCP_RSA_BITS", "1024"}})).is_error());
}

TEST(ConfigTest, FirstInvalidSettingIsReported) {
    ixcp::test::TempDir dir("ixcp_config");
    const auto file = dir / "client.json";
    ixcp::test::write_file(file, ixcp::to_bytes(R"({"api_key": 5, "max_in_flight": "four"})"));

    auto config = ixcp::load_client_config(fake_env({
        {"IXCP_CONFIG", file.string()},
        {"IXCP_CHUNK_SIZE", "lots"},
    }));
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(config.error().message, "api_key must be a string");

    auto server = ixcp::load_server_config(fake_env({
        {"IXCP_CONFIG", file.string()},
        {"IXCP_PORT", "-1"},
    }));
    ASSERT_TRUE(server.is_error());
    EXPECT_NE(server.error().message.find("IXCP_PORT"), std::string::npos);
}
