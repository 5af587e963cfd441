#include "http/server.hpp"
#include "http/dispatcher.hpp"
#include "http/endpoint.hpp"
#include "http/server_common.hpp"
#include "backend/backend_client.hpp"
#include "tools/drive_tools.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace drive_bridge {

    namespace {

        void send_probe_error(httplib::Response &res, const std::exception &e) {
            int status = 500;
            if (dynamic_cast<const BackendUnreachable *>(&e)) {
                status = 502;
            } else if (dynamic_cast<const BackendError *>(&e)) {
                status = 424;
            } else if (dynamic_cast<const std::invalid_argument *>(&e)) {
                status = 400;
            }
            send_json(res, status, {{"ok", false}, {"error", e.what()}});
        }

    }

    BridgeServer::BridgeServer(const BridgeConfig &config, const JsonRpcDispatcher &dispatcher,
                               IBackendClient &backend)
        : config_(config),
          dispatcher_(dispatcher),
          backend_(backend),
          auth_(config.secret),
          cors_(config.allowed_origins),
          sessions_(stream_capacity(config.worker_threads)) {
    }

    BridgeServer::~BridgeServer() {
        stop();
    }

    void BridgeServer::start() {
        if (running_) {
            spdlog::info("Server already running on port {}", bound_port_);
            return;
        }

        http_server_ = std::make_unique<httplib::Server>();
        int threads = config_.worker_threads;
        http_server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        register_routes();

        if (config_.port == 0) {
            bound_port_ = http_server_->bind_to_any_port(config_.host);
        } else {
            bound_port_ = http_server_->bind_to_port(config_.host, config_.port) ? config_.port : -1;
        }
        if (bound_port_ < 0) {
            throw std::runtime_error("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
        }

        if (!auth_.is_configured()) {
            spdlog::warn("BRIDGE_TOKEN is not set: every authenticated route will answer 500");
        }

        sessions_.reopen();
        running_ = true;
        server_thread_ = std::make_unique<std::thread>(&BridgeServer::server_thread_func, this);

        spdlog::info("=== drive-bridge started ===");
        spdlog::info("URL: http://{}:{}{}", config_.host, bound_port_, config_.messages_path);
        spdlog::info("Token: {}", redact(config_.secret));
        spdlog::info("Backend: {}", config_.backend.base_url.empty() ? "<unset>" : config_.backend.base_url);
    }

    void BridgeServer::stop() {
        if (running_ && http_server_) {
            http_server_->stop();
            sessions_.close_all();
            if (server_thread_ && server_thread_->joinable()) {
                server_thread_->join();
            }
            running_ = false;
            spdlog::info("Server stopped");
        }
    }

    bool BridgeServer::is_running() const {
        return running_;
    }

    void BridgeServer::server_thread_func() {
        try {
            if (!http_server_->listen_after_bind()) {
                spdlog::error("Server loop exited with an error");
            }
        } catch (const std::exception &e) {
            spdlog::error("Server error: {}", e.what());
        }
    }

    void BridgeServer::register_routes() {
        install_common_handlers(*http_server_, cors_);

        http_server_->Get("/", [](const httplib::Request &, httplib::Response &res) {
            res.set_content("drive-bridge is running.", "text/plain");
        });

        http_server_->Get("/health", [this](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, {
                {"ok", true},
                {"protocol", config_.protocol_version},
                {"backendConfigured", !config_.backend.base_url.empty() && !config_.backend.access_key.empty()},
                {"sessions", sessions_.size()}
            });
        });

        http_server_->Get(config_.messages_path, [this](const httplib::Request &req, httplib::Response &res) {
            handle_stream_open(req, res);
        });

        http_server_->Post(config_.messages_path, [this](const httplib::Request &req, httplib::Response &res) {
            handle_rpc(req, res);
        });

        http_server_->Get("/search", [this](const httplib::Request &req, httplib::Response &res) {
            handle_search_probe(req, res);
        });

        http_server_->Get("/fetch", [this](const httplib::Request &req, httplib::Response &res) {
            handle_fetch_probe(req, res);
        });
    }

    void BridgeServer::handle_stream_open(const httplib::Request &req, httplib::Response &res) {
        // Reachability probe; answered before auth so connectors can discover the service
        if (req.method == "HEAD") {
            res.status = 200;
            res.set_header("Cache-Control", "no-store");
            return;
        }

        if (!auth_.authorize(req, res)) {
            return;
        }

        std::string fallback_host = config_.host + ":" + std::to_string(bound_port_);
        std::string messages_url = resolve_messages_url(req, config_.messages_path, config_.trust_proxy,
                                                        fallback_host);

        if (wants_json_discovery(req)) {
            send_json(res, 200, {
                {"ok", true},
                {"mcp", true},
                {"transport", "streamable-http"},
                {"protocol", config_.protocol_version},
                {"messages", messages_url}
            });
            return;
        }

        auto session = std::make_shared<SseSession>(
            AuthGuard::extract_token(req),
            std::deque<std::string>{endpoint_event(messages_url)},
            config_.keepalive);
        if (attach_sse_stream(res, session, sessions_)) {
            spdlog::info("Stream opened, advertising {}", messages_url);
        }
    }

    void BridgeServer::handle_rpc(const httplib::Request &req, httplib::Response &res) {
        if (!auth_.authorize(req, res)) {
            return;
        }

        nlohmann::json response = dispatcher_.dispatch(req.body);

        std::string response_str = response.dump();
        spdlog::debug("Response size: {} bytes", response_str.size());
        res.status = 200;
        res.set_content(response_str, "application/json");
    }

    void BridgeServer::handle_search_probe(const httplib::Request &req, httplib::Response &res) {
        if (!auth_.authorize(req, res)) {
            return;
        }

        try {
            int max = kDefaultSearchMax;
            if (req.has_param("max")) {
                try {
                    max = std::stoi(req.get_param_value("max"));
                } catch (const std::exception &) {
                    throw InvalidArgumentsError("max must be an integer");
                }
            }
            auto data = backend_.search(req.get_param_value("q"), max);
            send_json(res, 200, {{"ok", true}, {"data", data}});
        } catch (const std::exception &e) {
            spdlog::warn("Search probe failed: {}", e.what());
            send_probe_error(res, e);
        }
    }

    void BridgeServer::handle_fetch_probe(const httplib::Request &req, httplib::Response &res) {
        if (!auth_.authorize(req, res)) {
            return;
        }

        try {
            auto id = req.get_param_value("id");
            if (id.empty()) {
                throw InvalidArgumentsError("id is required");
            }
            std::optional<std::string> lines;
            if (req.has_param("lines")) {
                lines = req.get_param_value("lines");
            }
            auto data = backend_.fetch(id, lines);
            send_json(res, 200, {{"ok", true}, {"data", data}});
        } catch (const std::exception &e) {
            spdlog::warn("Fetch probe failed: {}", e.what());
            send_probe_error(res, e);
        }
    }

}
