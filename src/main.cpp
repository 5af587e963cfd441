#include "backend/backend_client.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/signals.hpp"
#include "http/dispatcher.hpp"
#include "http/server.hpp"
#include "tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

int main() {
    using namespace drive_bridge;

    BridgeConfig config;
    try {
        config = load_bridge_config(process_env);
    } catch (const ConfigurationError &e) {
        std::cerr << "drive-bridge: " << e.what() << std::endl;
        return 1;
    }

    init_logging("drive-bridge", config.debug);

    HttpBackendClient backend(config.backend);
    if (!backend.is_configured()) {
        spdlog::warn("Backend not configured (BACKEND_BASE_URL / BACKEND_KEY): tool calls will fail");
    }
    ToolRegistry registry(backend);
    JsonRpcDispatcher dispatcher(registry, config.protocol_version);
    BridgeServer server(config, dispatcher, backend);

    try {
        server.start();
    } catch (const std::exception &e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    wait_for_shutdown_signal();
    spdlog::info("Shutting down");
    server.stop();
    return 0;
}
