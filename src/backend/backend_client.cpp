#include "backend/backend_client.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/url.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace drive_bridge {

    namespace {

        std::string error_message(const nlohmann::json &error) {
            if (error.is_string()) {
                return error.get<std::string>();
            }
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
            return error.dump();
        }

        void throw_if_failed(const nlohmann::json &envelope) {
            if (!envelope.is_object()) {
                return;
            }
            auto error = envelope.find("error");
            if (error != envelope.end() && !error->is_null() && !(error->is_boolean() && !error->get<bool>())) {
                throw BackendError(error_message(*error));
            }
            auto ok = envelope.find("ok");
            if (ok != envelope.end() && ok->is_boolean() && !ok->get<bool>()) {
                throw BackendError("Backend reported failure");
            }
        }

    }

    nlohmann::json normalize_envelope(const nlohmann::json &body) {
        throw_if_failed(body);
        if (!body.is_object() || !body.contains("data")) {
            return body;
        }

        nlohmann::json data = body["data"];
        if (data.is_object() && data.contains("data")) {
            throw_if_failed(data);
            return data["data"];
        }
        return data;
    }

    HttpBackendClient::HttpBackendClient(BackendConfig config) : config_(std::move(config)) {
    }

    bool HttpBackendClient::is_configured() const {
        return !config_.base_url.empty() && !config_.access_key.empty();
    }

    nlohmann::json HttpBackendClient::search(const std::string &query, int max) {
        return call_action("search", {{"q", query}, {"max", std::to_string(max)}});
    }

    nlohmann::json HttpBackendClient::fetch(const std::string &id, const std::optional<std::string> &lines) {
        std::vector<std::pair<std::string, std::string>> params{{"id", id}};
        if (lines) {
            params.emplace_back("lines", *lines);
        }
        return call_action("fetch", params);
    }

    nlohmann::json HttpBackendClient::call_action(const std::string &action,
                                                  const std::vector<std::pair<std::string, std::string>> &params) {
        if (!is_configured()) {
            throw ConfigurationError("Backend not configured (BACKEND_BASE_URL / BACKEND_KEY)");
        }

        SplitUrl url = split_url(config_.base_url);

        httplib::Params query;
        query.emplace("action", action);
        query.emplace("token", config_.access_key);
        for (const auto &param: params) {
            query.emplace(param.first, param.second);
        }

        httplib::Client client(url.origin);
        client.set_follow_location(true);
        client.set_connection_timeout(config_.timeout);
        client.set_read_timeout(config_.timeout);

        spdlog::debug("Backend call: action={}", action);

        auto res = client.Get(url.path, query, httplib::Headers{{"Accept", "application/json"}});
        if (!res) {
            throw BackendUnreachable("Backend unreachable: " + httplib::to_string(res.error()));
        }

        std::string content_type = res->get_header_value("Content-Type");
        std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (content_type.find("application/json") == std::string::npos) {
            throw BackendError("Backend returned non-JSON (" + std::to_string(res->status) + " " +
                               (content_type.empty() ? "no-ct" : content_type) + ") - first 200: " +
                               res->body.substr(0, 200));
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(res->body);
        } catch (const nlohmann::json::parse_error &e) {
            throw BackendError("Backend returned malformed JSON: " + std::string(e.what()));
        }

        spdlog::debug("Backend {} -> {}", action, preview(body.dump()));
        return normalize_envelope(body);
    }

}
