#include "common/signals.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace drive_bridge {

    namespace {
        std::atomic<bool> shutdown_requested{false};

        void on_shutdown_signal(int) {
            shutdown_requested = true;
        }
    }

    void wait_for_shutdown_signal() {
        std::signal(SIGINT, on_shutdown_signal);
        std::signal(SIGTERM, on_shutdown_signal);
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

}
