#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hermes
{
    /** Largest accepted per-target or process request timeout, in seconds. */
    inline constexpr std::uint64_t kMaxTimeoutSeconds = 3600;

    /** Retry/backoff parameters for outbound sends. */
    struct RetryPolicy
    {
        std::uint32_t attempts{3};      // total attempts, first send included
        std::uint64_t delay_ms{1000};   // delay before the first retry
        double backoff_multiplier{2.0}; // growth factor per further retry

        bool operator==(const RetryPolicy &) const = default;
    };

    struct TargetConfig
    {
        std::string url;
        std::string method;
        std::map<std::string, std::string> headers;
        std::optional<std::uint64_t> timeout_seconds;
    };

    struct RegisterConfig
    {
        std::string endpoint;
        std::string method; // informational, inbound traffic is not filtered by it
        TargetConfig target;
        std::string template_source;
        std::optional<RetryPolicy> retry_config;
    };

    struct AppSettings
    {
        std::uint32_t retry_attempts{3};
        std::uint64_t retry_delay_ms{1000};
        double retry_backoff_multiplier{2.0};
        bool enable_metrics{false};
        bool strict_templates{false};
    };

    struct RelayConfig
    {
        std::vector<RegisterConfig> registers;
        AppSettings settings{};
    };

    enum class ConfigFormat
    {
        Yaml,
        Toml,
        Json
    };

    /**
     * ConfigLoader reads the relay configuration from YAML, TOML or JSON.
     * Every format is first converted to nlohmann::json, then mapped onto
     * RelayConfig by a single schema reader.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a file; the format is picked from the extension. */
        static Result<RelayConfig> load(const std::string &path);

        /** Parse config from in-memory content of the given format. */
        static Result<RelayConfig> from_string(const std::string &content, ConfigFormat format);

        /** Map an already parsed JSON document onto the config schema. */
        static Result<RelayConfig> from_json(const nlohmann::json &j);

        /** Serialize config back to JSON (used by admin output and tests). */
        static nlohmann::json to_json(const RelayConfig &cfg);

        /**
         * Full validation as performed by `hermes-admin validate-config`:
         * endpoint format and uniqueness, inbound and target methods, target
         * URL, header format and retry values. Template syntax is checked by
         * building an EndpointRegistry.
         */
        static Result<void> validate(const RelayConfig &cfg);

        static Result<ConfigFormat> format_for_path(const std::string &path);
    };

    /** True for GET, POST, PUT, DELETE and PATCH in any letter case. */
    bool is_supported_method(const std::string &method);

    /**
     * Load KEY=VALUE pairs from a dotenv file into the environment without
     * overriding variables that are already set. A missing file is not an
     * error; returns the number of variables applied.
     */
    Result<std::size_t> load_dotenv(const std::string &path);

} // namespace hermes
