#pragma once

#include "types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace hermes
{
    /** Fully resolved outbound call for one dispatched request. */
    struct OutboundRequest
    {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers;
        nlohmann::json body;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};

        bool operator==(const OutboundRequest &) const = default;
    };

    struct UpstreamResponse
    {
        unsigned status{0};
        nlohmann::json body; // parsed JSON, or the raw text as a JSON string
    };

    using ForwardHandler = std::function<void(Result<UpstreamResponse>)>;

    /**
     * Map a configured method name onto an HTTP verb. Case-insensitive over
     * GET, POST, PUT, DELETE and PATCH; anything else is UnsupportedMethod.
     */
    Result<boost::beast::http::verb> map_method(const std::string &method);

    /** Parse an upstream body as JSON, falling back to a JSON string. */
    nlohmann::json parse_response_body(const std::string &text);

    /**
     * Asynchronous sender of outbound requests. The handler is invoked
     * exactly once, on an executor owned by the implementation.
     */
    class Forwarder
    {
    public:
        virtual ~Forwarder() = default;

        virtual void send(OutboundRequest request, ForwardHandler handler) = 0;
    };

    struct ForwarderConfig
    {
        bool verify_tls{true};
        std::string user_agent{"hermes"};
        std::size_t max_response_bytes{8 * 1024 * 1024};
    };

    /**
     * Boost.Beast client. Each send runs on its own strand: resolve, connect,
     * TLS handshake for https targets, write, read. The request timeout is a
     * deadline over the whole exchange. Transport failures are NetworkError;
     * an unusable target URL is ConfigError and is not worth retrying.
     */
    class HttpForwarder : public Forwarder
    {
    public:
        explicit HttpForwarder(boost::asio::any_io_executor executor, ForwarderConfig cfg = ForwarderConfig{});
        ~HttpForwarder() override;

        void send(OutboundRequest request, ForwardHandler handler) override;

    private:
        class Impl;
        std::shared_ptr<Impl> impl_;
    };

} // namespace hermes
