#pragma once

#include "endpoint_registry.hpp"
#include "forwarding_client.hpp"
#include "types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace hermes
{
    /** Status and JSON body returned to the inbound caller. */
    struct DispatchResponse
    {
        unsigned status{200};
        nlohmann::json body;
    };

    using DispatchHandler = std::function<void(DispatchResponse)>;

    /** Everything needed to forward one request, computed before any I/O. */
    struct PreparedForward
    {
        OutboundRequest request;
        RetryPolicy retry;
    };

    struct DispatcherConfig
    {
        std::chrono::seconds default_timeout{30};
    };

    /**
     * Per-request pipeline: lookup, parse, render, validate, forward, wrap.
     * Stateless between requests and safe to share across server threads.
     */
    class Dispatcher
    {
    public:
        Dispatcher(std::shared_ptr<const EndpointRegistry> registry, std::shared_ptr<Forwarder> forwarder,
                   boost::asio::any_io_executor executor, DispatcherConfig cfg = DispatcherConfig{});

        /**
         * Resolve `path` and transform `body` into the outbound request.
         * Errors: NotFound, InvalidInput, TemplateRenderError,
         * RenderedPayloadNotJson.
         */
        Result<PreparedForward> prepare(std::string_view path, const std::string &body) const;

        /** Run the full pipeline; `done` is called exactly once. */
        void dispatch(std::string_view path, const std::string &body, DispatchHandler done) const;

        /** Log the raw body; always succeeds. */
        static DispatchResponse debug(const std::string &body);

        static DispatchResponse error_response(const HermesError &error);

        static unsigned status_for(ErrorCode code);

    private:
        std::shared_ptr<const EndpointRegistry> registry_;
        std::shared_ptr<Forwarder> forwarder_;
        boost::asio::any_io_executor executor_;
        DispatcherConfig cfg_;
    };

} // namespace hermes
