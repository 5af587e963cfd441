#pragma once

#include <stdexcept>
#include <string>

namespace drive_bridge {

    class BridgeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;

        // Short machine-readable name, surfaced as error.data.kind
        virtual const char *kind() const noexcept { return "internal_error"; }
    };

    class ConfigurationError : public BridgeError {
    public:
        using BridgeError::BridgeError;
        const char *kind() const noexcept override { return "configuration_error"; }
    };

    class UnauthorizedError : public BridgeError {
    public:
        UnauthorizedError() : BridgeError("Unauthorized") {
        }

        const char *kind() const noexcept override { return "unauthorized"; }
    };

    class BackendError : public BridgeError {
    public:
        using BridgeError::BridgeError;
        const char *kind() const noexcept override { return "backend_error"; }
    };

    class BackendUnreachable : public BridgeError {
    public:
        using BridgeError::BridgeError;
        const char *kind() const noexcept override { return "backend_unreachable"; }
    };

    class UnknownToolError : public BridgeError {
    public:
        explicit UnknownToolError(const std::string &name)
            : BridgeError("Unknown tool: " + name), name_(name) {
        }

        const char *kind() const noexcept override { return "unknown_tool"; }
        const std::string &tool_name() const { return name_; }

    private:
        std::string name_;
    };

    class InvalidArgumentsError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

}
