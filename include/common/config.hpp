#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace drive_bridge {

    constexpr const char *kServerName = "drive-bridge";
    constexpr const char *kServerVersion = "1.0.0";
    constexpr const char *kDefaultProtocolVersion = "2024-11-05";

    // Returns the value of a variable, or nullopt when unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    struct BackendConfig {
        std::string base_url;
        std::string access_key;
        std::chrono::seconds timeout{30};
    };

    struct BridgeConfig {
        std::string host = "0.0.0.0";
        int port = 10000;
        std::string secret;
        std::string messages_path = "/mcp";
        std::string protocol_version = kDefaultProtocolVersion;
        std::chrono::milliseconds keepalive{25000};
        bool trust_proxy = true;
        std::vector<std::string> allowed_origins;
        int worker_threads = 32;
        bool debug = false;
        BackendConfig backend;
    };

    struct GatewayConfig {
        std::string host = "0.0.0.0";
        int port = 5051;
        std::string secret;
        std::string upstream_url = "http://127.0.0.1:5050/mcp";
        std::string upstream_secret;
        std::chrono::seconds upstream_timeout{60};
        std::string messages_path = "/mcp";
        std::string protocol_version = kDefaultProtocolVersion;
        std::chrono::milliseconds keepalive{25000};
        bool trust_proxy = true;
        std::vector<std::string> allowed_origins{"https://chat.openai.com", "https://chatgpt.com"};
        int worker_threads = 32;
        bool debug = false;
    };

    std::optional<std::string> process_env(const std::string &name);

    BridgeConfig load_bridge_config(const EnvLookup &env);

    GatewayConfig load_gateway_config(const EnvLookup &env);

}
