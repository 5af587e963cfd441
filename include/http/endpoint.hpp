#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace httplib {
    struct Request;
}

namespace drive_bridge {

    struct PublicOrigin {
        std::string scheme;
        std::string host;

        std::string to_string() const { return scheme + "://" + host; }
    };

    // Scheme and host the client used to reach us. Forwarded headers win when
    // `trust_proxy` is set; `fallback_host` is used when no Host header exists.
    PublicOrigin resolve_public_origin(const httplib::Request &req, bool trust_proxy,
                                       const std::string &fallback_host);

    // Absolute URL for JSON-RPC POSTs. A token presented as ?token= is carried over.
    std::string resolve_messages_url(const httplib::Request &req, const std::string &messages_path,
                                     bool trust_proxy, const std::string &fallback_host);

    nlohmann::json endpoint_payload(const std::string &messages_url);

    std::string endpoint_event(const std::string &messages_url);

    // True for clients that ask for application/json but not text/event-stream
    bool wants_json_discovery(const httplib::Request &req);

}
