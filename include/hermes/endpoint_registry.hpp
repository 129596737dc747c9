#pragma once

#include "config.hpp"
#include "template_engine.hpp"
#include "types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hermes
{
    struct Target
    {
        std::string url;
        std::string method;
        std::map<std::string, std::string> headers;
        std::optional<std::chrono::seconds> timeout;
    };

    struct WebhookRule
    {
        std::string endpoint;
        std::string inbound_method;
        Target target;
        TemplateHandle compiled_template;
        std::optional<RetryPolicy> retry_policy;
    };

    /**
     * Immutable path -> rule map. Built once at startup and shared read-only
     * between all request handlers, so lookups need no locking.
     */
    class EndpointRegistry
    {
    public:
        /**
         * Compile every register's template and index the rules by endpoint.
         * Fails on malformed templates, endpoints not starting with '/', and
         * duplicate endpoints.
         */
        static Result<std::shared_ptr<const EndpointRegistry>> build(const RelayConfig &cfg,
                                                                     std::shared_ptr<TemplateRenderer> renderer);

        /** Build with the default MustacheRenderer (strictness from settings). */
        static Result<std::shared_ptr<const EndpointRegistry>> build(const RelayConfig &cfg);

        /** Exact match on the path; nullptr when no rule is registered. */
        const WebhookRule *lookup(std::string_view path) const;

        /** Registered endpoints, sorted. */
        std::vector<std::string> endpoints() const;

        std::size_t size() const { return rules_.size(); }

        const TemplateRenderer &renderer() const { return *renderer_; }

        const AppSettings &settings() const { return settings_; }

    private:
        EndpointRegistry(std::shared_ptr<TemplateRenderer> renderer, AppSettings settings);

        std::shared_ptr<TemplateRenderer> renderer_;
        AppSettings settings_;
        std::unordered_map<std::string, WebhookRule> rules_;
    };

} // namespace hermes
