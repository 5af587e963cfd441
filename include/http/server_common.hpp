#pragma once

#include <nlohmann/json.hpp>

namespace httplib {
    class Server;
    struct Response;
}

namespace drive_bridge {

    class CorsPolicy;

    // CORS on every request (OPTIONS answered with 204 before routing), access
    // logging, a plain-text 404 and a JSON-RPC shaped 500 for escaped exceptions.
    void install_common_handlers(httplib::Server &server, const CorsPolicy &cors);

    void send_json(httplib::Response &res, int status, const nlohmann::json &body);

}
