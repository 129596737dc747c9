#include "hermes/endpoint_registry.hpp"
#include "hermes/logging.hpp"
#include <algorithm>

namespace hermes
{
    EndpointRegistry::EndpointRegistry(std::shared_ptr<TemplateRenderer> renderer, AppSettings settings)
        : renderer_(std::move(renderer)), settings_(settings)
    {
    }

    Result<std::shared_ptr<const EndpointRegistry>> EndpointRegistry::build(const RelayConfig &cfg)
    {
        return build(cfg, std::make_shared<MustacheRenderer>(RenderOptions{cfg.settings.strict_templates}));
    }

    Result<std::shared_ptr<const EndpointRegistry>> EndpointRegistry::build(const RelayConfig &cfg,
                                                                            std::shared_ptr<TemplateRenderer> renderer)
    {
        if (!renderer)
            return std::unexpected(HermesError::internal("EndpointRegistry requires a template renderer"));

        auto log = logging::category("config");
        std::shared_ptr<EndpointRegistry> registry(new EndpointRegistry(std::move(renderer), cfg.settings));

        for (std::size_t i = 0; i < cfg.registers.size(); ++i)
        {
            const auto &reg = cfg.registers[i];
            const std::string ctx = "Register " + std::to_string(i);

            if (reg.endpoint.empty() || reg.endpoint.front() != '/')
                return std::unexpected(HermesError::config(ctx + ": endpoint must start with '/'"));

            if (registry->rules_.contains(reg.endpoint))
            {
                return std::unexpected(HermesError::config(
                    ctx + ": duplicate endpoint '" + reg.endpoint + "'"));
            }

            if (const auto &t = reg.target.timeout_seconds; t && (*t == 0 || *t > kMaxTimeoutSeconds))
            {
                return std::unexpected(HermesError::config(ctx + ": timeout_seconds must be between 1 and " +
                                                           std::to_string(kMaxTimeoutSeconds)));
            }

            auto handle = registry->renderer_->compile("template_" + std::to_string(i), reg.template_source);
            if (!handle)
            {
                return std::unexpected(HermesError::template_compile(
                    ctx + " (" + reg.endpoint + "): template error: " + handle.error().what()));
            }

            WebhookRule rule{};
            rule.endpoint = reg.endpoint;
            rule.inbound_method = reg.method;
            rule.target.url = reg.target.url;
            rule.target.method = reg.target.method;
            rule.target.headers = reg.target.headers;
            if (reg.target.timeout_seconds)
                rule.target.timeout = std::chrono::seconds(*reg.target.timeout_seconds);
            rule.compiled_template = std::move(*handle);
            rule.retry_policy = reg.retry_config;

            log->info("Registered: {} {} -> {} {}", reg.method, reg.endpoint, reg.target.method, reg.target.url);
            registry->rules_.emplace(reg.endpoint, std::move(rule));
        }

        return std::shared_ptr<const EndpointRegistry>(std::move(registry));
    }

    const WebhookRule *EndpointRegistry::lookup(std::string_view path) const
    {
        auto it = rules_.find(std::string(path));
        if (it == rules_.end())
            return nullptr;
        return &it->second;
    }

    std::vector<std::string> EndpointRegistry::endpoints() const
    {
        std::vector<std::string> out;
        out.reserve(rules_.size());
        for (const auto &[endpoint, rule] : rules_)
            out.push_back(endpoint);
        std::sort(out.begin(), out.end());
        return out;
    }

} // namespace hermes
