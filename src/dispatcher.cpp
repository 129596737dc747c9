#include "hermes/dispatcher.hpp"
#include "hermes/json_util.hpp"
#include "hermes/logging.hpp"
#include "hermes/retry.hpp"

namespace hermes
{
    Dispatcher::Dispatcher(std::shared_ptr<const EndpointRegistry> registry, std::shared_ptr<Forwarder> forwarder,
                           boost::asio::any_io_executor executor, DispatcherConfig cfg)
        : registry_(std::move(registry)), forwarder_(std::move(forwarder)), executor_(std::move(executor)), cfg_(cfg)
    {
    }

    Result<PreparedForward> Dispatcher::prepare(std::string_view path, const std::string &body) const
    {
        const WebhookRule *rule = registry_->lookup(path);
        if (!rule)
            return std::unexpected(HermesError::not_found("Endpoint not found"));

        auto payload = parse_json(body);
        if (!payload)
            return std::unexpected(HermesError::invalid_input(std::string("Invalid JSON: ") + payload.error().what()));

        auto data = to_template_data(std::move(*payload));
        auto rendered = registry_->renderer().render(rule->compiled_template, data);
        if (!rendered)
        {
            return std::unexpected(HermesError::template_render(std::string("Template rendering failed: ") +
                                                                rendered.error().what()));
        }

        auto outbound = parse_json(*rendered);
        if (!outbound)
        {
            return std::unexpected(HermesError::rendered_not_json(
                std::string("Rendered template is not valid JSON: ") + outbound.error().what()));
        }

        PreparedForward out{};
        out.request.method = rule->target.method;
        out.request.url = rule->target.url;
        out.request.headers = rule->target.headers;
        out.request.body = std::move(*outbound);
        out.request.timeout = rule->target.timeout.value_or(cfg_.default_timeout);
        out.retry = resolve_retry_policy(rule->retry_policy, registry_->settings());
        return out;
    }

    void Dispatcher::dispatch(std::string_view path, const std::string &body, DispatchHandler done) const
    {
        auto log = logging::category("dispatch");

        auto prepared = prepare(path, body);
        if (!prepared)
        {
            if (prepared.error().code == ErrorCode::NotFound)
                log->debug("No rule for {}", path);
            else
                log->warn("{}: {}", path, prepared.error().what());
            done(error_response(prepared.error()));
            return;
        }

        log->debug("Forwarding {} to {} {}", path, prepared->request.method, prepared->request.url);

        send_with_retry(forwarder_, executor_, std::move(prepared->request), prepared->retry,
                        [done = std::move(done), endpoint = std::string(path), log](Result<UpstreamResponse> result)
                        {
                            if (!result)
                            {
                                log->error("{}: {}", endpoint, result.error().what());
                                done(error_response(result.error()));
                                return;
                            }

                            log->info("{} forwarded, upstream status {}", endpoint, result->status);
                            done(DispatchResponse{
                                200, {{"status", "success"}, {"target_response", std::move(result->body)}}});
                        });
    }

    DispatchResponse Dispatcher::debug(const std::string &body)
    {
        logging::category("dispatch")->info("Debug payload: {}", body);
        return DispatchResponse{200, {{"status", "success"}, {"message", "Payload logged"}}};
    }

    DispatchResponse Dispatcher::error_response(const HermesError &error)
    {
        return DispatchResponse{status_for(error.code), {{"error", error.what()}}};
    }

    unsigned Dispatcher::status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::InvalidInput:
            return 400;
        default:
            return 500;
        }
    }

} // namespace hermes
