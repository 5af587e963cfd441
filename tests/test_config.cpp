#include "common/config.hpp"
#include "common/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace drive_bridge;
using drive_bridge::test::env_from;

TEST(BridgeConfig, DefaultsWhenEnvironmentIsEmpty) {
    auto config = load_bridge_config(env_from({}));
    EXPECT_EQ(config.port, 10000);
    EXPECT_EQ(config.messages_path, "/mcp");
    EXPECT_EQ(config.protocol_version, "2024-11-05");
    EXPECT_EQ(config.keepalive, std::chrono::seconds(25));
    EXPECT_TRUE(config.secret.empty());
    EXPECT_TRUE(config.trust_proxy);
    EXPECT_FALSE(config.debug);
}

TEST(BridgeConfig, ReadsPrimaryAndFallbackNames) {
    auto config = load_bridge_config(env_from({
        {"PORT", "8080"},
        {"TOKEN", "legacy"},
        {"GAS_BASE_URL", "https://script.example.com/exec///"},
        {"GAS_KEY", "k"},
        {"KEEPALIVE_SECONDS", "15"},
        {"DEBUG", "1"},
    }));
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.secret, "legacy");
    EXPECT_EQ(config.backend.base_url, "https://script.example.com/exec");
    EXPECT_EQ(config.backend.access_key, "k");
    EXPECT_EQ(config.keepalive, std::chrono::seconds(15));
    EXPECT_TRUE(config.debug);

    auto preferred = load_bridge_config(env_from({{"TOKEN", "legacy"}, {"BRIDGE_TOKEN", "current"}}));
    EXPECT_EQ(preferred.secret, "current");
}

TEST(BridgeConfig, BlankValuesCountAsUnset) {
    auto config = load_bridge_config(env_from({{"BRIDGE_TOKEN", "   "}, {"PORT", ""}}));
    EXPECT_TRUE(config.secret.empty());
    EXPECT_EQ(config.port, 10000);
}

TEST(BridgeConfig, RejectsMalformedNumbersAndFlags) {
    EXPECT_THROW(load_bridge_config(env_from({{"PORT", "eighty"}})), ConfigurationError);
    EXPECT_THROW(load_bridge_config(env_from({{"PORT", "70000"}})), ConfigurationError);
    EXPECT_THROW(load_bridge_config(env_from({{"KEEPALIVE_SECONDS", "10s"}})), ConfigurationError);
    EXPECT_THROW(load_bridge_config(env_from({{"DEBUG", "maybe"}})), ConfigurationError);
    EXPECT_THROW(load_bridge_config(env_from({{"WORKER_THREADS", "1"}})), ConfigurationError);
    EXPECT_THROW(load_gateway_config(env_from({{"WORKER_THREADS", "1"}})), ConfigurationError);
}

TEST(BridgeConfig, NormalizesMessagesPath) {
    auto config = load_bridge_config(env_from({{"MESSAGES_PATH", "rpc"}}));
    EXPECT_EQ(config.messages_path, "/rpc");
}

TEST(GatewayConfig, DefaultsAndUpstreamSecretFallback) {
    auto config = load_gateway_config(env_from({{"BRIDGE_TOKEN", "shared"}}));
    EXPECT_EQ(config.port, 5051);
    EXPECT_EQ(config.upstream_url, "http://127.0.0.1:5050/mcp");
    EXPECT_EQ(config.upstream_secret, "shared");
    ASSERT_EQ(config.allowed_origins.size(), 2u);
    EXPECT_EQ(config.allowed_origins[0], "https://chat.openai.com");
}

TEST(GatewayConfig, ParsesOriginListAndUpstream) {
    auto config = load_gateway_config(env_from({
        {"SSE_PORT", "6000"},
        {"CORE_URL", "http://core:5050/mcp"},
        {"UPSTREAM_TOKEN", "inner"},
        {"ALLOWED_ORIGINS", " https://a.example , ,https://b.example"},
    }));
    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.upstream_url, "http://core:5050/mcp");
    EXPECT_EQ(config.upstream_secret, "inner");
    EXPECT_EQ(config.allowed_origins, (std::vector<std::string>{"https://a.example", "https://b.example"}));
}
