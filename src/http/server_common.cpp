#include "http/server_common.hpp"
#include "http/cors.hpp"
#include "http/jsonrpc.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace drive_bridge {

    void install_common_handlers(httplib::Server &server, const CorsPolicy &cors) {
        server.set_pre_routing_handler([&cors](const httplib::Request &req, httplib::Response &res) {
            cors.apply(req, res);
            if (req.method == "OPTIONS") {
                res.status = 204;
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
            spdlog::info("{} {} -> {}", req.method, req.path, res.status);
        });

        server.set_error_handler([](const httplib::Request &, httplib::Response &res) {
            // Relayed responses stream their body through a provider and are left alone
            if (res.status == 404 && res.body.empty() && !res.content_provider_) {
                res.set_content("Not found", "text/plain");
            }
        });

        server.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
            std::string message = "Unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception &e) {
                message = e.what();
            } catch (...) {
                message = "Non-standard exception";
            }
            spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, message);
            send_json(res, 500, make_error(nullptr, rpc_code::kInternalError, "Internal error: " + message));
        });
    }

    void send_json(httplib::Response &res, int status, const nlohmann::json &body) {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

}
