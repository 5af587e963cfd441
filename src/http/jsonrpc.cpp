#include "http/jsonrpc.hpp"

namespace drive_bridge {

    namespace {

        bool valid_id(const nlohmann::json &id) {
            return id.is_null() || id.is_string() || id.is_number();
        }

    }

    ParsedRequest parse_request(const std::string &body) {
        ParsedRequest parsed;
        parsed.id = nullptr;

        // Containers past the limit are discarded while parsing, so no deep value is ever built
        bool too_deep = false;
        nlohmann::json::parser_callback_t limit_depth =
            [&too_deep](int depth, nlohmann::json::parse_event_t event, nlohmann::json &) {
                if ((event == nlohmann::json::parse_event_t::object_start ||
                     event == nlohmann::json::parse_event_t::array_start) && depth >= kMaxNestingDepth) {
                    too_deep = true;
                    return false;
                }
                return true;
            };

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(body, limit_depth);
        } catch (const nlohmann::json::parse_error &e) {
            parsed.problem = "Parse error: " + std::string(e.what());
            return parsed;
        }

        if (!j.is_object()) {
            parsed.problem = "Request must be a JSON object";
            return parsed;
        }

        auto id = j.find("id");
        if (id != j.end() && valid_id(*id)) {
            parsed.id = *id;
        } else if (id != j.end()) {
            parsed.problem = "id must be a string, number or null";
            return parsed;
        }

        if (too_deep) {
            parsed.problem = "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels";
            return parsed;
        }

        auto version = j.find("jsonrpc");
        if (version == j.end() || !version->is_string() || version->get<std::string>() != "2.0") {
            parsed.problem = "jsonrpc must be \"2.0\"";
            return parsed;
        }

        auto method = j.find("method");
        if (method == j.end() || !method->is_string()) {
            parsed.problem = "method must be a string";
            return parsed;
        }

        RpcRequest req;
        req.id = parsed.id;
        req.method = method->get<std::string>();
        auto params = j.find("params");
        if (params != j.end() && !params->is_null()) {
            req.params = std::move(*params);
        }
        parsed.request = std::move(req);
        return parsed;
    }

    nlohmann::json make_result(const nlohmann::json &id, nlohmann::json result) {
        nlohmann::json response;
        response["jsonrpc"] = "2.0";
        response["id"] = id;
        response["result"] = std::move(result);
        return response;
    }

    nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message,
                              const std::optional<nlohmann::json> &data) {
        nlohmann::json error = {
            {"code", code},
            {"message", message}
        };
        if (data) {
            error["data"] = *data;
        }

        nlohmann::json response;
        response["jsonrpc"] = "2.0";
        response["id"] = id;
        response["error"] = error;
        return response;
    }

}
