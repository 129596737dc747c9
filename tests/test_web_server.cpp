#include <catch2/catch_test_macros.hpp>
#include "hermes/web_server.hpp"
#include "test_support.hpp"
#include <future>

using namespace hermes;
using namespace hermes::testing;
using nlohmann::json;

namespace
{
    class RunningServer
    {
    public:
        RunningServer(WebServerConfig cfg, const RelayConfig &relay)
        {
            auto registry = EndpointRegistry::build(relay);
            REQUIRE(registry);
            server_ = std::make_unique<WebServer>(cfg, *registry);
            port_ = server_->listen();
            thread_ = std::thread([this] { server_->run(); });
        }

        ~RunningServer()
        {
            shutdown();
        }

        void shutdown()
        {
            if (!thread_.joinable())
                return;
            server_->stop();
            thread_.join();
        }

        std::uint16_t port() const { return port_; }

    private:
        std::unique_ptr<WebServer> server_;
        std::uint16_t port_{0};
        std::thread thread_;
    };

    WebServerConfig test_config()
    {
        WebServerConfig cfg{};
        cfg.bind_address = "127.0.0.1";
        cfg.port = 0;
        cfg.threads = 2;
        cfg.handle_signals = false;
        cfg.request_timeout = std::chrono::seconds(5);
        cfg.shutdown_grace = std::chrono::seconds(5);
        return cfg;
    }

    RelayConfig relay_to(const std::string &url)
    {
        auto cfg = single_register("/hook", url, R"({"text":"{{msg}}","n":{{json n}}})");
        cfg.registers[0].target.headers = {{"X-Api-Key", "secret"}};
        cfg.settings.retry_attempts = 1;
        return cfg;
    }
} // namespace

TEST_CASE("Webhooks are transformed and relayed end to end", "[server]")
{
    MockUpstream upstream(200, R"({"received":true})");
    RunningServer server(test_config(), relay_to(upstream.url("/in")));

    auto reply = http_request(server.port(), http::verb::post, "/hook?source=test", R"({"msg":"hi","n":[1,2]})");
    REQUIRE(reply.status == 200);
    REQUIRE(reply.body == json{{"status", "success"}, {"target_response", {{"received", true}}}});

    auto seen = upstream.requests();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].method == "POST");
    REQUIRE(seen[0].target == "/in");
    REQUIRE(json::parse(seen[0].body) == json{{"text", "hi"}, {"n", {1, 2}}});
    REQUIRE(seen[0].headers.at("X-Api-Key") == "secret");
    REQUIRE(seen[0].headers.at("Content-Type") == "application/json");
}

TEST_CASE("Inbound method does not restrict dispatch", "[server]")
{
    MockUpstream upstream;
    RunningServer server(test_config(), relay_to(upstream.url()));

    auto reply = http_request(server.port(), http::verb::put, "/hook", R"({"msg":"m","n":0})");
    REQUIRE(reply.status == 200);
    REQUIRE(upstream.requests().size() == 1);
}

TEST_CASE("Pipeline errors map to statuses", "[server]")
{
    MockUpstream upstream;
    RunningServer server(test_config(), relay_to(upstream.url()));

    auto missing = http_request(server.port(), http::verb::post, "/unknown", "{}");
    REQUIRE(missing.status == 404);
    REQUIRE(missing.body == json{{"error", "Endpoint not found"}});

    auto invalid = http_request(server.port(), http::verb::post, "/hook", "{broken");
    REQUIRE(invalid.status == 400);
    REQUIRE(invalid.body["error"].get<std::string>().rfind("Invalid JSON: ", 0) == 0);

    REQUIRE(upstream.requests().empty());
}

TEST_CASE("Deeply nested bodies are rejected and the server keeps serving", "[server]")
{
    MockUpstream upstream;
    RunningServer server(test_config(), relay_to(upstream.url()));

    const std::string deep = std::string(100000, '[') + std::string(100000, ']');
    auto reply = http_request(server.port(), http::verb::post, "/hook", deep);
    REQUIRE(reply.status == 400);
    REQUIRE(reply.body == json{{"error", "Invalid JSON: nesting depth exceeds 128"}});
    REQUIRE(upstream.requests().empty());

    auto next = http_request(server.port(), http::verb::post, "/hook", R"({"msg":"ok","n":1})");
    REQUIRE(next.status == 200);
}

TEST_CASE("Bodies over the size limit get 413", "[server]")
{
    MockUpstream upstream;
    auto cfg = test_config();
    cfg.max_body_bytes = 64;
    RunningServer server(cfg, relay_to(upstream.url()));

    const std::string body = R"({"msg":")" + std::string(200, 'x') + R"(","n":1})";
    auto reply = http_request(server.port(), http::verb::post, "/hook", body);
    REQUIRE(reply.status == 413);
    REQUIRE(reply.body == json{{"error", "Payload too large"}});
    REQUIRE_FALSE(reply.keep_alive);
    REQUIRE(upstream.requests().empty());

    auto small = http_request(server.port(), http::verb::post, "/hook", R"({"msg":"a","n":1})");
    REQUIRE(small.status == 200);
}

TEST_CASE("Health, readiness and debug routes", "[server]")
{
    RunningServer server(test_config(), relay_to("http://127.0.0.1:9/"));

    auto health = http_request(server.port(), http::verb::get, "/health");
    REQUIRE(health.status == 200);
    REQUIRE(health.body["status"] == "healthy");
    REQUIRE(health.body["service"] == "hermes-rs");

    auto ready = http_request(server.port(), http::verb::get, "/ready");
    REQUIRE(ready.status == 200);
    REQUIRE(ready.body["checks"]["config"] == "ok");

    auto wrong = http_request(server.port(), http::verb::post, "/health", "{}");
    REQUIRE(wrong.status == 405);

    auto debug = http_request(server.port(), http::verb::post, "/debug", "anything, even not JSON");
    REQUIRE(debug.status == 200);
    REQUIRE(debug.body == json{{"status", "success"}, {"message", "Payload logged"}});

    auto debug_get = http_request(server.port(), http::verb::get, "/debug");
    REQUIRE(debug_get.status == 405);
    REQUIRE(debug_get.body == json{{"error", "Method not allowed"}});
}

TEST_CASE("Disabled health checks fall through to dispatch", "[server]")
{
    auto cfg = test_config();
    cfg.health_check_enabled = false;
    RunningServer server(cfg, relay_to("http://127.0.0.1:9/"));

    auto health = http_request(server.port(), http::verb::get, "/health");
    REQUIRE(health.status == 404);
}

TEST_CASE("Unreachable targets are a 500", "[server]")
{
    RunningServer server(test_config(), relay_to("http://127.0.0.1:" + std::to_string(unused_port()) + "/"));

    auto reply = http_request(server.port(), http::verb::post, "/hook", R"({"msg":"x","n":1})");
    REQUIRE(reply.status == 500);
    REQUIRE(reply.body["error"].get<std::string>().rfind("Failed to send request to target: ", 0) == 0);
}

TEST_CASE("Requests over the in-flight cap get 503", "[server]")
{
    MockUpstream upstream;
    upstream.set_delay(std::chrono::milliseconds(800));

    auto cfg = test_config();
    cfg.max_concurrent_requests = 1;
    RunningServer server(cfg, relay_to(upstream.url()));

    auto slow = std::async(std::launch::async, [&]
                           { return http_request(server.port(), http::verb::post, "/hook", R"({"msg":"a","n":1})"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto rejected = http_request(server.port(), http::verb::post, "/hook", R"({"msg":"b","n":2})");
    REQUIRE(rejected.status == 503);
    REQUIRE(rejected.body == json{{"error", "Too many concurrent requests"}});

    REQUIRE(slow.get().status == 200);
}

TEST_CASE("Stopping lets in-flight requests finish", "[server]")
{
    MockUpstream upstream;
    upstream.set_delay(std::chrono::milliseconds(500));
    RunningServer server(test_config(), relay_to(upstream.url()));

    auto in_flight = std::async(std::launch::async, [&]
                                { return http_request(server.port(), http::verb::post, "/hook", R"({"msg":"a","n":1})"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    server.shutdown();
    auto reply = in_flight.get();
    REQUIRE(reply.status == 200);
    REQUIRE_FALSE(reply.keep_alive);
}
