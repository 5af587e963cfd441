#pragma once

#include "common/config.hpp"
#include "http/auth.hpp"
#include "http/cors.hpp"
#include "http/sse.hpp"

#include <memory>
#include <thread>
#include <atomic>

namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace drive_bridge {

    class IBackendClient;
    class JsonRpcDispatcher;

    // Dispatcher process entry point: JSON-RPC over POST, the streaming handshake,
    // health and the REST probes.
    class BridgeServer {
    public:
        BridgeServer(const BridgeConfig &config, const JsonRpcDispatcher &dispatcher, IBackendClient &backend);

        ~BridgeServer();

        BridgeServer(const BridgeServer &) = delete;
        BridgeServer &operator=(const BridgeServer &) = delete;

        // Binds synchronously (throws std::runtime_error on failure), then serves on a background thread
        void start();

        void stop();

        bool is_running() const;

        // Bound port; meaningful after start(), resolves port 0 to the chosen one
        int port() const { return bound_port_; }

        size_t open_streams() const { return sessions_.size(); }

    private:
        const BridgeConfig &config_;
        const JsonRpcDispatcher &dispatcher_;
        IBackendClient &backend_;
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

        void handle_rpc(const httplib::Request &req, httplib::Response &res);

        void handle_search_probe(const httplib::Request &req, httplib::Response &res);

        void handle_fetch_probe(const httplib::Request &req, httplib::Response &res);
    };

}
