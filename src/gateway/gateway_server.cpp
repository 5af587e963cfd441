#include "gateway/gateway_server.hpp"
#include "gateway/upstream_relay.hpp"
#include "http/endpoint.hpp"
#include "http/jsonrpc.hpp"
#include "http/server_common.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace drive_bridge {

    namespace {

        std::string lowercase(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return value;
        }

        // Not relayed: recomputed for the downstream connection or overlaid by the gateway
        bool is_dropped_header(const std::string &lower_name) {
            return lower_name == "content-length" || lower_name == "transfer-encoding" ||
                   lower_name == "connection" || lower_name == "keep-alive" || lower_name == "vary" ||
                   lower_name == "cache-control" || lower_name.rfind("access-control-", 0) == 0;
        }

    }

    GatewayServer::GatewayServer(const GatewayConfig &config)
        : config_(config),
          upstream_(split_url(config.upstream_url)),
          auth_(config.secret),
          cors_(config.allowed_origins),
          sessions_(stream_capacity(config.worker_threads)) {
    }

    GatewayServer::~GatewayServer() {
        stop();
    }

    void GatewayServer::start() {
        if (running_) {
            spdlog::info("Gateway already running on port {}", bound_port_);
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
        server_thread_ = std::make_unique<std::thread>(&GatewayServer::server_thread_func, this);

        spdlog::info("Gateway listening on :{} - GET/POST http://localhost:{}{}", bound_port_, bound_port_,
                     config_.messages_path);
        spdlog::info("Upstream: {}", config_.upstream_url);
    }

    void GatewayServer::stop() {
        if (running_ && http_server_) {
            http_server_->stop();
            sessions_.close_all();
            if (server_thread_ && server_thread_->joinable()) {
                server_thread_->join();
            }
            running_ = false;
            spdlog::info("Gateway stopped");
        }
    }

    bool GatewayServer::is_running() const {
        return running_;
    }

    void GatewayServer::server_thread_func() {
        try {
            if (!http_server_->listen_after_bind()) {
                spdlog::error("Gateway loop exited with an error");
            }
        } catch (const std::exception &e) {
            spdlog::error("Gateway error: {}", e.what());
        }
    }

    std::string GatewayServer::hello_frame() const {
        nlohmann::json result;
        result["protocolVersion"] = config_.protocol_version;
        result["capabilities"] = {{"tools", nlohmann::json::object()}};
        result["serverInfo"] = {
            {"name", std::string(kServerName) + " (SSE gateway)"},
            {"version", kServerVersion}
        };
        return sse_event("message", make_result("0", result).dump());
    }

    void GatewayServer::register_routes() {
        install_common_handlers(*http_server_, cors_);

        http_server_->Get("/health", [this](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, {
                {"ok", true},
                {"upstream", config_.upstream_url},
                {"sessions", sessions_.size()}
            });
        });

        http_server_->Get(config_.messages_path, [this](const httplib::Request &req, httplib::Response &res) {
            handle_stream_open(req, res);
        });

        http_server_->Post(config_.messages_path, [this](const httplib::Request &req, httplib::Response &res) {
            handle_proxy(req, res);
        });
    }

    void GatewayServer::handle_stream_open(const httplib::Request &req, httplib::Response &res) {
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

        auto session = std::make_shared<SseSession>(
            AuthGuard::extract_token(req),
            std::deque<std::string>{endpoint_event(messages_url), hello_frame()},
            config_.keepalive);
        if (attach_sse_stream(res, session, sessions_)) {
            spdlog::info("Gateway stream opened, advertising {}", messages_url);
        }
    }

    void GatewayServer::handle_proxy(const httplib::Request &req, httplib::Response &res) {
        if (!auth_.authorize(req, res)) {
            return;
        }

        std::string accept = req.get_header_value("Accept");
        httplib::Headers headers{
            {"Accept", accept.empty() ? "application/json" : accept},
            {"X-Forwarded-For", req.remote_addr},
            {"X-Bridge-Token", config_.upstream_secret}
        };
        std::string content_type = req.get_header_value("Content-Type");
        if (content_type.empty()) {
            content_type = "application/json";
        }
        headers.emplace("Content-Type", content_type);

        auto relay = std::make_shared<UpstreamRelay>(upstream_, config_.upstream_timeout, std::move(headers),
                                                     req.body);
        UpstreamRelay::Head head;
        try {
            head = relay->start();
        } catch (const BackendUnreachable &e) {
            spdlog::error("Upstream {} unreachable: {}", config_.upstream_url, e.what());
            send_json(res, 502, make_error(nullptr, rpc_code::kUpstreamError,
                                           std::string("Upstream error: ") + e.what()));
            return;
        }

        res.status = head.status;
        std::string upstream_type = "application/json";
        for (const auto &header: head.headers) {
            std::string name = lowercase(header.first);
            if (name == "content-type") {
                upstream_type = header.second;
            } else if (!is_dropped_header(name)) {
                res.set_header(header.first, header.second);
            }
        }
        res.set_header("Cache-Control", "no-store");

        if (head.status == 204 || head.status == 304) {
            return;
        }

        res.set_chunked_content_provider(
            upstream_type,
            [relay](size_t, httplib::DataSink &sink) {
                std::string chunk;
                if (relay->next_chunk(chunk)) {
                    return sink.write(chunk.data(), chunk.size());
                }
                if (relay->failed()) {
                    return false;
                }
                sink.done();
                return true;
            },
            [relay](bool) {
                relay->cancel();
            });
    }

}
