#include "http/endpoint.hpp"
#include "http/sse.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace drive_bridge {

    namespace {

        // First entry of a comma-separated forwarded header, trimmed and lowercased when asked
        std::string first_forwarded(const std::string &value, bool lowercase) {
            std::string entry = value.substr(0, value.find(','));
            auto begin = entry.find_first_not_of(" \t");
            auto end = entry.find_last_not_of(" \t");
            if (begin == std::string::npos) {
                return "";
            }
            entry = entry.substr(begin, end - begin + 1);
            if (lowercase) {
                std::transform(entry.begin(), entry.end(), entry.begin(),
                               [](unsigned char c) { return std::tolower(c); });
            }
            return entry;
        }

    }

    PublicOrigin resolve_public_origin(const httplib::Request &req, bool trust_proxy,
                                       const std::string &fallback_host) {
        PublicOrigin origin{"http", ""};

        if (trust_proxy) {
            auto proto = first_forwarded(req.get_header_value("X-Forwarded-Proto"), true);
            if (proto == "http" || proto == "https") {
                origin.scheme = proto;
            }
            origin.host = first_forwarded(req.get_header_value("X-Forwarded-Host"), false);
        }
        if (origin.host.empty()) {
            origin.host = req.get_header_value("Host");
        }
        if (origin.host.empty()) {
            origin.host = fallback_host;
        }
        return origin;
    }

    std::string resolve_messages_url(const httplib::Request &req, const std::string &messages_path,
                                     bool trust_proxy, const std::string &fallback_host) {
        std::string url = resolve_public_origin(req, trust_proxy, fallback_host).to_string() + messages_path;
        // Only a token the client itself put in the query is echoed; header tokens never enter the URL
        auto token = req.get_param_value("token");
        if (!token.empty()) {
            url = httplib::append_query_params(url, httplib::Params{{"token", token}});
        }
        return url;
    }

    nlohmann::json endpoint_payload(const std::string &messages_url) {
        return {{"messages", messages_url}};
    }

    std::string endpoint_event(const std::string &messages_url) {
        return sse_event("endpoint", endpoint_payload(messages_url).dump());
    }

    bool wants_json_discovery(const httplib::Request &req) {
        auto accept = req.get_header_value("Accept");
        std::transform(accept.begin(), accept.end(), accept.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return accept.find("application/json") != std::string::npos &&
               accept.find("text/event-stream") == std::string::npos;
    }

}
