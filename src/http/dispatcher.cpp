#include "http/dispatcher.hpp"
#include "http/handlers.hpp"
#include "tools/tool_registry.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

namespace drive_bridge {

    JsonRpcDispatcher::JsonRpcDispatcher(const ToolRegistry &registry, std::string protocol_version)
        : registry_(registry), protocol_version_(std::move(protocol_version)) {
        methods_ = {
            {"initialize", [this](const nlohmann::json &params) {
                return handle_initialize(params, protocol_version_);
            }},
            {"tools/list", [this](const nlohmann::json &) {
                return handle_tools_list(registry_);
            }},
            {"tools/call", [this](const nlohmann::json &params) {
                return handle_tool_call(registry_, params);
            }},
            {"ping", [](const nlohmann::json &) {
                return nlohmann::json::object();
            }},
            {"notifications/initialized", [](const nlohmann::json &) {
                spdlog::info("Client initialized");
                return nlohmann::json::object();
            }}
        };
    }

    nlohmann::json JsonRpcDispatcher::dispatch(const std::string &body) const {
        ParsedRequest parsed = parse_request(body);
        if (!parsed.request) {
            spdlog::warn("Invalid request: {}", parsed.problem);
            return make_error(parsed.id, rpc_code::kInvalidRequest, "Invalid Request: " + parsed.problem);
        }
        return dispatch(*parsed.request);
    }

    nlohmann::json JsonRpcDispatcher::dispatch(const RpcRequest &request) const {
        spdlog::info("Request: method={}", request.method);

        auto it = methods_.find(request.method);
        if (it == methods_.end()) {
            spdlog::warn("Unknown method: {}", request.method);
            return make_error(request.id, rpc_code::kMethodNotFound, "Method not found: " + request.method);
        }

        try {
            return make_result(request.id, it->second(request.params));
        } catch (const UnknownToolError &e) {
            return make_error(request.id, rpc_code::kMethodNotFound, e.what(),
                              nlohmann::json{{"kind", e.kind()}, {"tool", e.tool_name()}});
        } catch (const std::invalid_argument &e) {
            return make_error(request.id, rpc_code::kInvalidParams, e.what());
        } catch (const BridgeError &e) {
            spdlog::error("{} failed: {}", request.method, e.what());
            return make_error(request.id, rpc_code::kServerError, e.what(), nlohmann::json{{"kind", e.kind()}});
        } catch (const nlohmann::json::exception &e) {
            spdlog::error("{} failed: {}", request.method, e.what());
            return make_error(request.id, rpc_code::kServerError, e.what(),
                              nlohmann::json{{"kind", "malformed_payload"}});
        } catch (const std::exception &e) {
            spdlog::error("{} failed: {}", request.method, e.what());
            return make_error(request.id, rpc_code::kServerError, e.what(),
                              nlohmann::json{{"kind", "internal_error"}});
        }
    }

}
