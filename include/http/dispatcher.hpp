#pragma once

#include "http/jsonrpc.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace drive_bridge {

    class ToolRegistry;

    // Routes one JSON-RPC envelope to its method handler and always produces
    // exactly one response envelope. Stateless across requests.
    class JsonRpcDispatcher {
    public:
        using MethodHandler = std::function<nlohmann::json(const nlohmann::json &params)>;

        JsonRpcDispatcher(const ToolRegistry &registry, std::string protocol_version);

        JsonRpcDispatcher(const JsonRpcDispatcher &) = delete;
        JsonRpcDispatcher &operator=(const JsonRpcDispatcher &) = delete;

        nlohmann::json dispatch(const std::string &body) const;

        nlohmann::json dispatch(const RpcRequest &request) const;

    private:
        const ToolRegistry &registry_;
        std::string protocol_version_;
        std::unordered_map<std::string, MethodHandler> methods_;
    };

}
