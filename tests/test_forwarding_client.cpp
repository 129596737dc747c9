#include <catch2/catch_test_macros.hpp>
#include "hermes/forwarding_client.hpp"
#include "hermes/retry.hpp"
#include "test_support.hpp"
#include <boost/asio/io_context.hpp>
#include <optional>

using namespace hermes;
using namespace hermes::testing;

namespace
{
    Result<UpstreamResponse> send_and_wait(OutboundRequest request)
    {
        boost::asio::io_context ioc;
        HttpForwarder forwarder(ioc.get_executor(), ForwarderConfig{true, "hermes/test"});
        std::optional<Result<UpstreamResponse>> got;
        forwarder.send(std::move(request), [&](Result<UpstreamResponse> r) { got = std::move(r); });
        ioc.run();
        REQUIRE(got.has_value());
        return std::move(*got);
    }
} // namespace

TEST_CASE("map_method accepts the five verbs in any case", "[forward]")
{
    REQUIRE(map_method("GET") == http::verb::get);
    REQUIRE(map_method("post") == http::verb::post);
    REQUIRE(map_method("Put") == http::verb::put);
    REQUIRE(map_method("delete") == http::verb::delete_);
    REQUIRE(map_method("PATCH") == http::verb::patch);

    auto bad = map_method("FOO");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().code == ErrorCode::UnsupportedMethod);
    REQUIRE(std::string(bad.error().what()) == "Unsupported HTTP method: FOO");
}

TEST_CASE("Response bodies fall back to strings", "[forward]")
{
    REQUIRE(parse_response_body(R"({"a":1})") == nlohmann::json{{"a", 1}});
    REQUIRE(parse_response_body("[1,2]") == nlohmann::json::array({1, 2}));
    REQUIRE(parse_response_body("plain text") == nlohmann::json("plain text"));
    REQUIRE(parse_response_body("") == nlohmann::json(""));
}

TEST_CASE("Forwarder sends the JSON body with target headers", "[forward]")
{
    MockUpstream upstream(201, R"({"id":7})");

    OutboundRequest request;
    request.method = "put";
    request.url = upstream.url("/items?src=hermes");
    request.headers = {{"Authorization", "Bearer secret"}, {"Content-Type", "text/plain"}, {"X-Trace", "abc"}};
    request.body = nlohmann::json{{"name", "widget"}, {"qty", 2}};
    request.timeout = std::chrono::seconds(5);

    auto result = send_and_wait(request);
    REQUIRE(result);
    REQUIRE(result->status == 201);
    REQUIRE(result->body == nlohmann::json{{"id", 7}});

    auto seen = upstream.requests();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].method == "PUT");
    REQUIRE(seen[0].target == "/items?src=hermes");
    REQUIRE(nlohmann::json::parse(seen[0].body) == request.body);
    REQUIRE(seen[0].headers.at("Authorization") == "Bearer secret");
    REQUIRE(seen[0].headers.at("X-Trace") == "abc");
    REQUIRE(seen[0].headers.at("Content-Type") == "application/json");
    REQUIRE(seen[0].headers.at("User-Agent") == "hermes/test");
    REQUIRE(seen[0].headers.at("Host") == "127.0.0.1:" + std::to_string(upstream.port()));
}

TEST_CASE("Non-2xx responses are returned, not treated as failures", "[forward]")
{
    MockUpstream upstream(502, "bad gateway", "text/plain");

    OutboundRequest request;
    request.method = "POST";
    request.url = upstream.url();
    request.body = nlohmann::json::object();

    auto result = send_and_wait(request);
    REQUIRE(result);
    REQUIRE(result->status == 502);
    REQUIRE(result->body == nlohmann::json("bad gateway"));
}

TEST_CASE("Connection failures are NetworkErrors", "[forward]")
{
    OutboundRequest request;
    request.method = "POST";
    request.url = "http://127.0.0.1:" + std::to_string(unused_port()) + "/";
    request.body = nlohmann::json::object();

    auto result = send_and_wait(request);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == ErrorCode::NetworkError);
    REQUIRE(std::string(result.error().what()).rfind("Failed to send request to target: ", 0) == 0);
}

TEST_CASE("The request timeout bounds a slow upstream", "[forward]")
{
    MockUpstream upstream;
    upstream.set_delay(std::chrono::milliseconds(1500));

    OutboundRequest request;
    request.method = "POST";
    request.url = upstream.url();
    request.body = nlohmann::json::object();
    request.timeout = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    auto result = send_and_wait(request);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == ErrorCode::NetworkError);
    REQUIRE(elapsed < std::chrono::milliseconds(1400));
}

TEST_CASE("Unsupported methods fail without touching the network", "[forward]")
{
    MockUpstream upstream;

    OutboundRequest request;
    request.method = "TRACE";
    request.url = upstream.url();
    request.body = nlohmann::json::object();

    auto result = send_and_wait(request);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == ErrorCode::UnsupportedMethod);
    REQUIRE(upstream.requests().empty());
}

TEST_CASE("Unparseable target URLs are configuration errors", "[forward]")
{
    OutboundRequest request;
    request.method = "POST";
    request.url = "not a url";
    request.body = nlohmann::json::object();

    auto result = send_and_wait(request);
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code == ErrorCode::ConfigError);
    REQUIRE(std::string(result.error().what()).rfind("Failed to send request to target: ", 0) == 0);
    REQUIRE_FALSE(is_retryable(result.error()));
}

TEST_CASE("Overly nested upstream bodies are kept as text", "[forward]")
{
    const std::string deep = std::string(200, '[') + std::string(200, ']');
    REQUIRE(parse_response_body(deep) == nlohmann::json(deep));
}
