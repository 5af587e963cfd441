#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace drive_bridge {

    namespace rpc_code {
        constexpr int kInvalidRequest = -32600;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;
        constexpr int kServerError = -32000;
        constexpr int kUnauthorized = -32001;
        constexpr int kMisconfigured = -32002;
        constexpr int kUpstreamError = -32098;
    }

    // Deepest container nesting accepted in a request body
    constexpr int kMaxNestingDepth = 64;

    struct RpcRequest {
        nlohmann::json id;  // string, number or null
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    // Outcome of envelope validation: either a request, or the id to answer -32600 with
    struct ParsedRequest {
        std::optional<RpcRequest> request;
        nlohmann::json id;
        std::string problem;
    };

    ParsedRequest parse_request(const std::string &body);

    nlohmann::json make_result(const nlohmann::json &id, nlohmann::json result);

    nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message,
                              const std::optional<nlohmann::json> &data = std::nullopt);

}
