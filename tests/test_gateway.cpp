#include "gateway/gateway_server.hpp"
#include "http/cors.hpp"
#include "http/dispatcher.hpp"
#include "http/server.hpp"
#include "tools/tool_registry.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <httplib.h>

#include <memory>

using namespace drive_bridge;
using namespace std::chrono_literals;
using drive_bridge::test::FakeBackend;
using drive_bridge::test::LocalServer;
using drive_bridge::test::eventually;
using drive_bridge::test::read_sse_frames;
using drive_bridge::test::sample_files;

namespace {

    const std::string kToolsList = R"({"jsonrpc":"2.0","id":11,"method":"tools/list"})";

    GatewayConfig gateway_config(const std::string &upstream_url) {
        GatewayConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.secret = "outer";
        config.upstream_url = upstream_url;
        config.upstream_secret = "inner";
        config.upstream_timeout = 5s;
        config.keepalive = 50ms;
        config.worker_threads = 8;
        config.allowed_origins = {"https://chatgpt.com"};
        return config;
    }

    BridgeConfig bridge_config() {
        BridgeConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.secret = "inner";
        config.worker_threads = 8;
        return config;
    }

    const httplib::Headers kAuth{{"Authorization", "Bearer outer"}};

}

TEST(CorsPolicy, EchoesAllowListedOriginElseWildcard) {
    CorsPolicy cors({"https://chatgpt.com"});
    EXPECT_EQ(cors.allow_origin("https://chatgpt.com"), "https://chatgpt.com");
    EXPECT_EQ(cors.allow_origin("https://evil.example"), "*");
    EXPECT_EQ(cors.allow_origin(""), "*");

    httplib::Request req;
    req.headers.emplace("Origin", "https://chatgpt.com");
    httplib::Response res;
    cors.apply(req, res);
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Origin"), "https://chatgpt.com");
    EXPECT_EQ(res.get_header_value("Access-Control-Allow-Credentials"), "true");
    EXPECT_EQ(res.get_header_value("Vary"), "Origin");
}

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_.search_result = sample_files(3);
        bridge_.start();
        gateway_config_ = gateway_config("http://127.0.0.1:" + std::to_string(bridge_.port()) + "/mcp");
        gateway_ = std::make_unique<GatewayServer>(gateway_config_);
        gateway_->start();
    }

    httplib::Client gateway_client() {
        httplib::Client cli("127.0.0.1", gateway_->port());
        cli.set_read_timeout(5s);
        return cli;
    }

    BridgeConfig bridge_config_ = bridge_config();
    FakeBackend backend_;
    ToolRegistry registry_{backend_};
    JsonRpcDispatcher dispatcher_{registry_, bridge_config_.protocol_version};
    BridgeServer bridge_{bridge_config_, dispatcher_, backend_};
    GatewayConfig gateway_config_;
    std::unique_ptr<GatewayServer> gateway_;
};

TEST_F(GatewayTest, ProxyRelaysUpstreamEnvelopeUnchanged) {
    httplib::Client direct("127.0.0.1", bridge_.port());
    auto expected = direct.Post("/mcp", httplib::Headers{{"X-Bridge-Token", "inner"}}, kToolsList, "application/json");
    ASSERT_TRUE(expected);

    auto cli = gateway_client();
    httplib::Headers headers{{"Authorization", "Bearer outer"}, {"Origin", "https://chatgpt.com"},
                             {"Accept", "application/json, text/event-stream"}};
    auto res = cli.Post("/mcp", headers, kToolsList, "application/json");

    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, expected->body);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "https://chatgpt.com");
    EXPECT_EQ(res->get_header_value_count("Access-Control-Allow-Origin"), 1u);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(res->get_header_value("Cache-Control"), "no-store");
}

TEST_F(GatewayTest, ProxyCarriesToolCallsEndToEnd) {
    auto cli = gateway_client();
    std::string body = R"({"jsonrpc":"2.0","id":"q","method":"tools/call",)"
                       R"("params":{"name":"search","arguments":{"q":"quarterly report","max":5}}})";
    auto res = cli.Post("/mcp?token=outer", body, "application/json");

    ASSERT_TRUE(res);
    auto response = nlohmann::json::parse(res->body);
    EXPECT_EQ(response["id"], "q");
    EXPECT_EQ(response["result"]["content"][0]["type"], "json");
    EXPECT_EQ(response["result"]["content"][0]["json"].size(), 3u);
}

TEST_F(GatewayTest, ProxyRelaysUpstreamStatus) {
    GatewayConfig wrong_secret = gateway_config_;
    wrong_secret.upstream_secret = "not-inner";
    GatewayServer gateway(wrong_secret);
    gateway.start();

    httplib::Client cli("127.0.0.1", gateway.port());
    auto res = cli.Post("/mcp", kAuth, kToolsList, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], -32001);
}

TEST_F(GatewayTest, RejectsWrongTokenBeforeProxying) {
    auto cli = gateway_client();
    auto res = cli.Post("/mcp", httplib::Headers{{"Authorization", "Bearer inner"}}, kToolsList, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32001);
    EXPECT_TRUE(body["id"].is_null());
    EXPECT_EQ(res->get_header_value("Vary"), "Origin");
}

TEST_F(GatewayTest, HeadIsUnauthenticatedLivenessProbe) {
    auto cli = gateway_client();
    auto res = cli.Head("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Cache-Control"), "no-store");
}

TEST_F(GatewayTest, OptionsPreflightSkipsAuth) {
    auto cli = gateway_client();
    auto res = cli.Options("/mcp");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_NE(res->get_header_value("Access-Control-Allow-Headers").find("X-Bridge-Token"), std::string::npos);
}

TEST_F(GatewayTest, UnmatchedRouteIsPlainText404) {
    auto cli = gateway_client();
    auto res = cli.Put("/mcp", kAuth, "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->get_header_value("Content-Type"), "text/plain");
}

TEST_F(GatewayTest, HandshakeSendsEndpointHelloAndKeepalive) {
    auto cli = gateway_client();
    std::string stream = read_sse_frames(cli, "/mcp", kAuth, 3);

    EXPECT_EQ(stream.rfind("event: endpoint\n", 0), 0u);
    auto hello_at = stream.find("event: message\ndata: ");
    ASSERT_NE(hello_at, std::string::npos);
    auto hello_line = stream.substr(hello_at + 21, stream.find('\n', hello_at + 21) - (hello_at + 21));
    auto hello = nlohmann::json::parse(hello_line);
    EXPECT_EQ(hello["id"], "0");
    EXPECT_EQ(hello["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(hello["result"]["capabilities"]["tools"], nlohmann::json::object());
    EXPECT_NE(stream.find(": ping "), std::string::npos);
}

TEST_F(GatewayTest, HandshakeSurvivesUpstreamOutage) {
    bridge_.stop();
    auto cli = gateway_client();
    std::string stream = read_sse_frames(cli, "/mcp", kAuth, 2);
    EXPECT_NE(stream.find("event: message"), std::string::npos);
    EXPECT_TRUE(eventually([this] { return gateway_->open_streams() == 0; }));
}

TEST(GatewayUpstream, UnreachableUpstreamIs502WithJsonRpcError) {
    auto config = gateway_config("http://127.0.0.1:1/mcp");
    config.upstream_timeout = 2s;
    GatewayServer gateway(config);
    gateway.start();

    httplib::Client cli("127.0.0.1", gateway.port());
    auto res = cli.Post("/mcp", kAuth, kToolsList, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 502);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32098);
    EXPECT_TRUE(body["id"].is_null());
    EXPECT_NE(body["error"]["message"].get<std::string>().find("Upstream error"), std::string::npos);

    auto again = cli.Get("/health");
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 200);
}

TEST(GatewayUpstream, StreamsBodyAsUpstreamProducesIt) {
    LocalServer upstream;
    upstream.server().Post("/mcp", [](const httplib::Request &, httplib::Response &res) {
        res.status = 200;
        res.set_header("X-Upstream", "yes");
        res.set_chunked_content_provider("application/json", [](size_t offset, httplib::DataSink &sink) {
            if (offset == 0) {
                sink.write("{\"jsonrpc\":\"2.0\",", 17);
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            std::string rest = R"("id":1,"result":{}})";
            sink.write(rest.data(), rest.size());
            sink.done();
            return true;
        });
    });
    upstream.start();

    auto config = gateway_config(upstream.url("/mcp"));
    GatewayServer gateway(config);
    gateway.start();

    httplib::Client cli("127.0.0.1", gateway.port());
    auto res = cli.Post("/mcp", kAuth, kToolsList, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, R"({"jsonrpc":"2.0","id":1,"result":{}})");
    EXPECT_EQ(res->get_header_value("X-Upstream"), "yes");
}

TEST(GatewayUpstream, Upstream404BodyIsRelayedVerbatim) {
    LocalServer upstream;
    upstream.server().Post("/mcp", [](const httplib::Request &, httplib::Response &res) {
        res.status = 404;
        res.set_content(R"({"detail":"no such route upstream"})", "application/json");
    });
    upstream.start();

    auto config = gateway_config(upstream.url("/mcp"));
    GatewayServer gateway(config);
    gateway.start();

    httplib::Client cli("127.0.0.1", gateway.port());
    auto res = cli.Post("/mcp", kAuth, kToolsList, "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(res->body, R"({"detail":"no such route upstream"})");
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
}

TEST(GatewayConfigValidation, RejectsUnusableUpstreamUrl) {
    auto config = gateway_config("127.0.0.1:5050/mcp");
    EXPECT_THROW(GatewayServer gateway(config), ConfigurationError);
}
