#include "common/config.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <sstream>

namespace drive_bridge {

    namespace {

        std::string trim(const std::string &s) {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
            return begin < end ? std::string(begin, end) : std::string();
        }

        std::optional<std::string> lookup(const EnvLookup &env, const std::string &name) {
            auto value = env(name);
            if (!value) {
                return std::nullopt;
            }
            auto trimmed = trim(*value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return trimmed;
        }

        std::string first_of(const EnvLookup &env, std::initializer_list<const char *> names,
                             const std::string &fallback = "") {
            for (const char *name: names) {
                if (auto value = lookup(env, name)) {
                    return *value;
                }
            }
            return fallback;
        }

        int integer_of(const EnvLookup &env, const char *name, int fallback, int min, int max) {
            auto value = lookup(env, name);
            if (!value) {
                return fallback;
            }
            int parsed = 0;
            try {
                size_t used = 0;
                parsed = std::stoi(*value, &used);
                if (used != value->size()) {
                    throw std::invalid_argument(*value);
                }
            } catch (const std::exception &) {
                throw ConfigurationError(std::string(name) + " must be an integer, got '" + *value + "'");
            }
            if (parsed < min || parsed > max) {
                throw ConfigurationError(std::string(name) + " must be between " + std::to_string(min) +
                                         " and " + std::to_string(max));
            }
            return parsed;
        }

        bool flag_of(const EnvLookup &env, const char *name, bool fallback) {
            auto value = lookup(env, name);
            if (!value) {
                return fallback;
            }
            std::string v = *value;
            std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
            if (v == "1" || v == "true" || v == "yes" || v == "on") {
                return true;
            }
            if (v == "0" || v == "false" || v == "no" || v == "off") {
                return false;
            }
            throw ConfigurationError(std::string(name) + " must be a boolean, got '" + *value + "'");
        }

        std::vector<std::string> list_of(const EnvLookup &env, const char *name,
                                         const std::vector<std::string> &fallback) {
            auto value = lookup(env, name);
            if (!value) {
                return fallback;
            }
            std::vector<std::string> items;
            std::stringstream ss(*value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = trim(item);
                if (!item.empty()) {
                    items.push_back(item);
                }
            }
            return items;
        }

        std::string normalize_path(std::string path) {
            if (path.empty() || path.front() != '/') {
                path.insert(path.begin(), '/');
            }
            return path;
        }

    }

    std::optional<std::string> process_env(const std::string &name) {
        const char *value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    }

    BridgeConfig load_bridge_config(const EnvLookup &env) {
        BridgeConfig config;
        config.host = first_of(env, {"HOST"}, config.host);
        config.port = integer_of(env, "PORT", config.port, 0, 65535);
        config.secret = first_of(env, {"BRIDGE_TOKEN", "TOKEN"});
        config.messages_path = normalize_path(first_of(env, {"MESSAGES_PATH"}, config.messages_path));
        config.protocol_version = first_of(env, {"MCP_PROTOCOL"}, config.protocol_version);
        config.keepalive = std::chrono::seconds(integer_of(env, "KEEPALIVE_SECONDS", 25, 1, 3600));
        config.trust_proxy = flag_of(env, "TRUST_PROXY", config.trust_proxy);
        config.allowed_origins = list_of(env, "ALLOWED_ORIGINS", config.allowed_origins);
        config.worker_threads = integer_of(env, "WORKER_THREADS", config.worker_threads, 2, 1024);
        config.debug = flag_of(env, "DEBUG", config.debug);

        std::string base_url = first_of(env, {"BACKEND_BASE_URL", "GAS_BASE_URL"});
        while (!base_url.empty() && base_url.back() == '/') {
            base_url.pop_back();
        }
        config.backend.base_url = base_url;
        config.backend.access_key = first_of(env, {"BACKEND_KEY", "GAS_KEY"});
        config.backend.timeout = std::chrono::seconds(integer_of(env, "BACKEND_TIMEOUT_SECONDS", 30, 1, 600));
        return config;
    }

    GatewayConfig load_gateway_config(const EnvLookup &env) {
        GatewayConfig config;
        config.host = first_of(env, {"HOST"}, config.host);
        config.port = integer_of(env, "SSE_PORT", config.port, 0, 65535);
        config.secret = first_of(env, {"BRIDGE_TOKEN", "TOKEN"});
        config.upstream_url = first_of(env, {"CORE_URL"}, config.upstream_url);
        config.upstream_secret = first_of(env, {"UPSTREAM_TOKEN"}, config.secret);
        config.upstream_timeout = std::chrono::seconds(integer_of(env, "UPSTREAM_TIMEOUT_SECONDS", 60, 1, 600));
        config.messages_path = normalize_path(first_of(env, {"MESSAGES_PATH"}, config.messages_path));
        config.protocol_version = first_of(env, {"MCP_PROTOCOL"}, config.protocol_version);
        config.keepalive = std::chrono::seconds(integer_of(env, "KEEPALIVE_SECONDS", 25, 1, 3600));
        config.trust_proxy = flag_of(env, "TRUST_PROXY", config.trust_proxy);
        config.allowed_origins = list_of(env, "ALLOWED_ORIGINS", config.allowed_origins);
        config.worker_threads = integer_of(env, "WORKER_THREADS", config.worker_threads, 2, 1024);
        config.debug = flag_of(env, "DEBUG", config.debug);
        return config;
    }

}
