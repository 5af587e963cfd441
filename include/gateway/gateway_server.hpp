#pragma once

#include "common/config.hpp"
#include "common/url.hpp"
#include "http/auth.hpp"
#include "http/cors.hpp"
#include "http/sse.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace drive_bridge {

    // Front door in front of the dispatcher: CORS, shared-secret auth, its own
    // event stream, and a streaming POST relay to the upstream dispatcher.
    class GatewayServer {
    public:
        // Throws ConfigurationError when the upstream URL is unusable
        explicit GatewayServer(const GatewayConfig &config);

        ~GatewayServer();

        GatewayServer(const GatewayServer &) = delete;
        GatewayServer &operator=(const GatewayServer &) = delete;

        void start();

        void stop();

        bool is_running() const;

        int port() const { return bound_port_; }

        size_t open_streams() const { return sessions_.size(); }

        // The initialize-shaped event sent on every new stream
        std::string hello_frame() const;

    private:
        const GatewayConfig &config_;
        SplitUrl upstream_;
        AuthGuard auth_;
        CorsPolicy cors_;
        SessionRegistry sessions_;

        std::unique_ptr<std::thread> server_thread_;
        std::atomic<bool> running_{false};
        std::unique_ptr<httplib::Server> http_server_;
        int bound_port_ = -1;

        void register_routes();

        void server_thread_func();

        void handle_stream_open(const httplib::Request &req, httplib::Response &res);

        void handle_proxy(const httplib::Request &req, httplib::Response &res);
    };

}
