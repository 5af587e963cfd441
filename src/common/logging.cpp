#include "common/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace drive_bridge {

    void init_logging(const std::string &component, bool debug) {
        auto logger = spdlog::get(component);
        if (!logger) {
            logger = spdlog::stdout_color_mt(component);
        }
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }

    std::string preview(const std::string &text, size_t limit) {
        if (text.size() <= limit) {
            return text;
        }
        return text.substr(0, limit) + "...";
    }

    std::string redact(const std::string &secret) {
        if (secret.empty()) {
            return "<unset>";
        }
        if (secret.size() <= 4) {
            return std::string(secret.size(), '*');
        }
        return secret.front() + std::string(secret.size() - 2, '*') + secret.back();
    }

}
