#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/signals.hpp"
#include "gateway/gateway_server.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <memory>

int main() {
    using namespace drive_bridge;

    GatewayConfig config;
    try {
        config = load_gateway_config(process_env);
    } catch (const ConfigurationError &e) {
        std::cerr << "drive-gateway: " << e.what() << std::endl;
        return 1;
    }

    init_logging("drive-gateway", config.debug);

    std::unique_ptr<GatewayServer> gateway;
    try {
        gateway = std::make_unique<GatewayServer>(config);
        gateway->start();
    } catch (const std::exception &e) {
        spdlog::error("Startup failed: {}", e.what());
        return 1;
    }

    wait_for_shutdown_signal();
    spdlog::info("Shutting down");
    gateway->stop();
    return 0;
}
