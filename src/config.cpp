#include "hermes/config.hpp"
#include "hermes/logging.hpp"
#include "hermes/url.hpp"
#include <yaml-cpp/yaml.h>
#include <toml++/toml.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace hermes
{
    namespace
    {
        std::shared_ptr<spdlog::logger> config_log()
        {
            return logging::category("config");
        }

        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        nlohmann::json plain_scalar_to_json(const std::string &s)
        {
            if (s == "true" || s == "True" || s == "TRUE")
                return true;
            if (s == "false" || s == "False" || s == "FALSE")
                return false;

            const char *first = s.data();
            const char *last = s.data() + s.size();
            if (!s.empty())
            {
                long long i = 0;
                auto [iptr, iec] = std::from_chars(first, last, i);
                if (iec == std::errc{} && iptr == last)
                    return i;

                double d = 0.0;
                auto [dptr, dec] = std::from_chars(first, last, d);
                if (dec == std::errc{} && dptr == last)
                    return d;
            }
            return s;
        }

        /**
         * Convert a YAML node into JSON. Quoted and block scalars (tag "!")
         * stay strings so templates such as '42' are not turned into numbers.
         */
        nlohmann::json yaml_to_json(const YAML::Node &node)
        {
            using nlohmann::json;
            switch (node.Type())
            {
            case YAML::NodeType::Null:
                return nullptr;
            case YAML::NodeType::Scalar:
                if (node.Tag() == "!")
                    return node.Scalar();
                return plain_scalar_to_json(node.Scalar());
            case YAML::NodeType::Sequence:
            {
                json arr = json::array();
                for (const auto &item : node)
                    arr.push_back(yaml_to_json(item));
                return arr;
            }
            case YAML::NodeType::Map:
            {
                json obj = json::object();
                for (const auto &kv : node)
                    obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
                return obj;
            }
            default:
                return nullptr;
            }
        }

        nlohmann::json toml_to_json(const toml::node &node)
        {
            using nlohmann::json;
            if (const auto *table = node.as_table())
            {
                json obj = json::object();
                for (const auto &kv : *table)
                    obj[std::string(kv.first.str())] = toml_to_json(kv.second);
                return obj;
            }
            if (const auto *array = node.as_array())
            {
                json arr = json::array();
                for (const auto &item : *array)
                    arr.push_back(toml_to_json(item));
                return arr;
            }
            if (const auto *value = node.as_boolean())
                return value->get();
            if (const auto *value = node.as_integer())
                return value->get();
            if (const auto *value = node.as_floating_point())
                return value->get();
            if (const auto *value = node.as_string())
                return value->get();

            // dates and times keep their TOML spelling
            std::ostringstream oss;
            node.visit([&oss](const auto &n) { oss << n; });
            return oss.str();
        }

        // Schema readers. `ctx` names the location for error messages.

        Result<std::string> read_string(const nlohmann::json &obj, const char *key, const std::string &ctx)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return std::unexpected(HermesError::config(ctx + ": missing required field '" + key + "'"));
            if (it->is_string())
                return it->get<std::string>();
            if (it->is_number() || it->is_boolean())
                return it->dump();
            return std::unexpected(HermesError::config(ctx + ": field '" + key + "' must be a string"));
        }

        template <typename T>
        Result<std::optional<T>> read_unsigned(const nlohmann::json &obj, const char *key, const std::string &ctx)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return std::optional<T>{};
            if (it->is_number_unsigned())
                return std::optional<T>(static_cast<T>(it->get<std::uint64_t>()));
            if (it->is_number_integer() && it->get<std::int64_t>() >= 0)
                return std::optional<T>(static_cast<T>(it->get<std::int64_t>()));
            return std::unexpected(HermesError::config(ctx + ": field '" + key + "' must be a non-negative integer"));
        }

        Result<std::optional<double>> read_double(const nlohmann::json &obj, const char *key, const std::string &ctx)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return std::optional<double>{};
            if (it->is_number())
                return std::optional<double>(it->get<double>());
            return std::unexpected(HermesError::config(ctx + ": field '" + key + "' must be a number"));
        }

        Result<std::optional<bool>> read_bool(const nlohmann::json &obj, const char *key, const std::string &ctx)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return std::optional<bool>{};
            if (it->is_boolean())
                return std::optional<bool>(it->get<bool>());
            return std::unexpected(HermesError::config(ctx + ": field '" + key + "' must be a boolean"));
        }

        Result<RetryPolicy> parse_retry(const nlohmann::json &j, const std::string &ctx)
        {
            if (!j.is_object())
                return std::unexpected(HermesError::config(ctx + ": retry_config must be a mapping"));

            RetryPolicy policy{};
            auto attempts = read_unsigned<std::uint32_t>(j, "attempts", ctx + ".retry_config");
            if (!attempts)
                return std::unexpected(attempts.error());
            if (!*attempts)
                return std::unexpected(HermesError::config(ctx + ".retry_config: missing required field 'attempts'"));
            policy.attempts = **attempts;

            auto delay = read_unsigned<std::uint64_t>(j, "delay_ms", ctx + ".retry_config");
            if (!delay)
                return std::unexpected(delay.error());
            if (!*delay)
                return std::unexpected(HermesError::config(ctx + ".retry_config: missing required field 'delay_ms'"));
            policy.delay_ms = **delay;

            auto mult = read_double(j, "backoff_multiplier", ctx + ".retry_config");
            if (!mult)
                return std::unexpected(mult.error());
            if (!*mult)
                return std::unexpected(HermesError::config(ctx + ".retry_config: missing required field 'backoff_multiplier'"));
            policy.backoff_multiplier = **mult;
            return policy;
        }

        Result<TargetConfig> parse_target(const nlohmann::json &j, const std::string &ctx)
        {
            if (!j.is_object())
                return std::unexpected(HermesError::config(ctx + ": target must be a mapping"));

            TargetConfig target{};
            auto url = read_string(j, "url", ctx + ".target");
            if (!url)
                return std::unexpected(url.error());
            target.url = *url;

            auto method = read_string(j, "method", ctx + ".target");
            if (!method)
                return std::unexpected(method.error());
            target.method = *method;

            if (auto headers = j.find("headers"); headers != j.end() && !headers->is_null())
            {
                if (!headers->is_object())
                    return std::unexpected(HermesError::config(ctx + ".target: headers must be a mapping"));
                for (auto it = headers->begin(); it != headers->end(); ++it)
                {
                    if (it.value().is_string())
                        target.headers[it.key()] = it.value().get<std::string>();
                    else if (it.value().is_primitive() && !it.value().is_null())
                        target.headers[it.key()] = it.value().dump();
                    else
                        return std::unexpected(HermesError::config(ctx + ".target: header '" + it.key() + "' must be a scalar"));
                }
            }

            auto timeout = read_unsigned<std::uint64_t>(j, "timeout_seconds", ctx + ".target");
            if (!timeout)
                return std::unexpected(timeout.error());
            target.timeout_seconds = *timeout;
            if (target.timeout_seconds && *target.timeout_seconds == 0)
                return std::unexpected(HermesError::config(ctx + ".target: timeout_seconds must be greater than zero"));
            if (target.timeout_seconds && *target.timeout_seconds > kMaxTimeoutSeconds)
            {
                return std::unexpected(HermesError::config(ctx + ".target: timeout_seconds must not exceed " +
                                                           std::to_string(kMaxTimeoutSeconds)));
            }
            return target;
        }

        Result<RegisterConfig> parse_register(const nlohmann::json &j, std::size_t index)
        {
            const std::string ctx = "Register " + std::to_string(index);
            if (!j.is_object())
                return std::unexpected(HermesError::config(ctx + ": must be a mapping"));

            RegisterConfig reg{};
            auto endpoint = read_string(j, "endpoint", ctx);
            if (!endpoint)
                return std::unexpected(endpoint.error());
            reg.endpoint = *endpoint;

            auto method = read_string(j, "method", ctx);
            if (!method)
                return std::unexpected(method.error());
            reg.method = *method;

            auto target_it = j.find("target");
            if (target_it == j.end())
                return std::unexpected(HermesError::config(ctx + ": missing required field 'target'"));
            auto target = parse_target(*target_it, ctx);
            if (!target)
                return std::unexpected(target.error());
            reg.target = std::move(*target);

            auto tmpl = read_string(j, "template", ctx);
            if (!tmpl)
                return std::unexpected(tmpl.error());
            reg.template_source = *tmpl;

            if (auto retry = j.find("retry_config"); retry != j.end() && !retry->is_null())
            {
                auto policy = parse_retry(*retry, ctx);
                if (!policy)
                    return std::unexpected(policy.error());
                reg.retry_config = *policy;
            }
            return reg;
        }

        Result<AppSettings> parse_settings(const nlohmann::json &j)
        {
            AppSettings settings{};
            if (j.is_null())
                return settings;
            if (!j.is_object())
                return std::unexpected(HermesError::config("settings must be a mapping"));

            const std::string ctx = "settings";
            auto attempts = read_unsigned<std::uint32_t>(j, "retry_attempts", ctx);
            if (!attempts)
                return std::unexpected(attempts.error());
            if (*attempts)
                settings.retry_attempts = **attempts;

            auto delay = read_unsigned<std::uint64_t>(j, "retry_delay_ms", ctx);
            if (!delay)
                return std::unexpected(delay.error());
            if (*delay)
                settings.retry_delay_ms = **delay;

            auto mult = read_double(j, "retry_backoff_multiplier", ctx);
            if (!mult)
                return std::unexpected(mult.error());
            if (*mult)
                settings.retry_backoff_multiplier = **mult;

            auto metrics = read_bool(j, "enable_metrics", ctx);
            if (!metrics)
                return std::unexpected(metrics.error());
            if (*metrics)
                settings.enable_metrics = **metrics;

            auto strict = read_bool(j, "strict_templates", ctx);
            if (!strict)
                return std::unexpected(strict.error());
            if (*strict)
                settings.strict_templates = **strict;

            return settings;
        }

        bool is_header_token(const std::string &name)
        {
            static const std::string specials = "!#$%&'*+-.^_`|~";
            if (name.empty())
                return false;
            return std::all_of(name.begin(), name.end(), [](unsigned char c) {
                return std::isalnum(c) || specials.find(static_cast<char>(c)) != std::string::npos;
            });
        }

        Result<void> validate_retry(const RetryPolicy &policy, const std::string &ctx)
        {
            if (policy.attempts == 0)
                return std::unexpected(HermesError::validation(ctx + ": retry attempts must be at least 1"));
            if (!std::isfinite(policy.backoff_multiplier) || policy.backoff_multiplier < 1.0)
                return std::unexpected(HermesError::validation(ctx + ": backoff_multiplier must be >= 1.0"));
            return {};
        }

        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return {};
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

    } // namespace

    bool is_supported_method(const std::string &method)
    {
        auto m = lower(method);
        return m == "get" || m == "post" || m == "put" || m == "delete" || m == "patch";
    }

    Result<ConfigFormat> ConfigLoader::format_for_path(const std::string &path)
    {
        auto pos = path.find_last_of('.');
        if (pos == std::string::npos)
            return std::unexpected(HermesError::config("Unknown config file extension for " + path));
        auto ext = lower(path.substr(pos + 1));
        if (ext == "yml" || ext == "yaml")
            return ConfigFormat::Yaml;
        if (ext == "toml" || ext == "tml")
            return ConfigFormat::Toml;
        if (ext == "json")
            return ConfigFormat::Json;
        return std::unexpected(HermesError::config("Unsupported config format: " + ext));
    }

    Result<RelayConfig> ConfigLoader::load(const std::string &path)
    {
        auto format = format_for_path(path);
        if (!format)
            return std::unexpected(format.error());

        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(HermesError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        config_log()->debug("Loading config from {}", path);
        auto cfg = from_string(buffer.str(), *format);
        if (cfg)
            config_log()->info("Loaded configuration with {} webhook registers from {}", cfg->registers.size(), path);
        return cfg;
    }

    Result<RelayConfig> ConfigLoader::from_string(const std::string &content, ConfigFormat format)
    {
        nlohmann::json j;
        try
        {
            switch (format)
            {
            case ConfigFormat::Yaml:
                j = yaml_to_json(YAML::Load(content));
                break;
            case ConfigFormat::Toml:
                j = toml_to_json(toml::parse(content));
                break;
            case ConfigFormat::Json:
                j = nlohmann::json::parse(content);
                break;
            }
        }
        catch (const std::exception &e)
        {
            return std::unexpected(HermesError::config(std::string("Failed to parse config: ") + e.what()));
        }
        return from_json(j);
    }

    Result<RelayConfig> ConfigLoader::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(HermesError::config("config root must be a mapping"));

        RelayConfig cfg{};
        auto regs = j.find("registers");
        if (regs == j.end())
            return std::unexpected(HermesError::config("missing required field 'registers'"));
        if (!regs->is_null())
        {
            if (!regs->is_array())
                return std::unexpected(HermesError::config("'registers' must be a list"));
            for (std::size_t i = 0; i < regs->size(); ++i)
            {
                auto reg = parse_register((*regs)[i], i);
                if (!reg)
                    return std::unexpected(reg.error());
                cfg.registers.push_back(std::move(*reg));
            }
        }

        auto settings_it = j.find("settings");
        auto settings = parse_settings(settings_it == j.end() ? nlohmann::json{} : *settings_it);
        if (!settings)
            return std::unexpected(settings.error());
        cfg.settings = *settings;
        return cfg;
    }

    nlohmann::json ConfigLoader::to_json(const RelayConfig &cfg)
    {
        nlohmann::json regs = nlohmann::json::array();
        for (const auto &reg : cfg.registers)
        {
            nlohmann::json target = {
                {"url", reg.target.url},
                {"method", reg.target.method},
                {"headers", reg.target.headers}};
            if (reg.target.timeout_seconds)
                target["timeout_seconds"] = *reg.target.timeout_seconds;

            nlohmann::json r = {
                {"endpoint", reg.endpoint},
                {"method", reg.method},
                {"target", target},
                {"template", reg.template_source}};
            if (reg.retry_config)
            {
                r["retry_config"] = {
                    {"attempts", reg.retry_config->attempts},
                    {"delay_ms", reg.retry_config->delay_ms},
                    {"backoff_multiplier", reg.retry_config->backoff_multiplier}};
            }
            regs.push_back(std::move(r));
        }

        nlohmann::json j;
        j["registers"] = std::move(regs);
        j["settings"] = {
            {"retry_attempts", cfg.settings.retry_attempts},
            {"retry_delay_ms", cfg.settings.retry_delay_ms},
            {"retry_backoff_multiplier", cfg.settings.retry_backoff_multiplier},
            {"enable_metrics", cfg.settings.enable_metrics},
            {"strict_templates", cfg.settings.strict_templates}};
        return j;
    }

    Result<void> ConfigLoader::validate(const RelayConfig &cfg)
    {
        std::unordered_map<std::string, std::size_t> seen;
        for (std::size_t i = 0; i < cfg.registers.size(); ++i)
        {
            const auto &reg = cfg.registers[i];
            const std::string ctx = "Register " + std::to_string(i);

            if (reg.endpoint.empty() || reg.endpoint.front() != '/')
                return std::unexpected(HermesError::validation(ctx + ": endpoint must start with '/'"));

            if (auto [it, inserted] = seen.emplace(reg.endpoint, i); !inserted)
            {
                return std::unexpected(HermesError::validation(
                    ctx + ": duplicate endpoint '" + reg.endpoint + "' (already defined by register " +
                    std::to_string(it->second) + ")"));
            }

            if (!is_supported_method(reg.method))
                return std::unexpected(HermesError::validation(ctx + ": invalid HTTP method '" + reg.method + "'"));

            if (reg.target.url.empty())
                return std::unexpected(HermesError::validation(ctx + ": target URL cannot be empty"));
            if (auto url = Url::parse(reg.target.url); !url)
                return std::unexpected(HermesError::validation(ctx + ": invalid target URL: " + url.error().what()));

            if (!is_supported_method(reg.target.method))
                return std::unexpected(HermesError::validation(ctx + ": invalid target method '" + reg.target.method + "'"));

            for (const auto &[name, value] : reg.target.headers)
            {
                if (!is_header_token(name))
                    return std::unexpected(HermesError::validation(ctx + ": invalid header name '" + name + "'"));
                if (value.find_first_of("\r\n") != std::string::npos)
                    return std::unexpected(HermesError::validation(ctx + ": header '" + name + "' contains a line break"));
            }

            if (reg.target.timeout_seconds && *reg.target.timeout_seconds == 0)
                return std::unexpected(HermesError::validation(ctx + ": timeout_seconds must be greater than zero"));
            if (reg.target.timeout_seconds && *reg.target.timeout_seconds > kMaxTimeoutSeconds)
            {
                return std::unexpected(HermesError::validation(ctx + ": timeout_seconds must not exceed " +
                                                               std::to_string(kMaxTimeoutSeconds)));
            }

            if (reg.retry_config)
            {
                if (auto res = validate_retry(*reg.retry_config, ctx); !res)
                    return res;
            }
        }

        if (!std::isfinite(cfg.settings.retry_backoff_multiplier) || cfg.settings.retry_backoff_multiplier < 1.0)
            return std::unexpected(HermesError::validation("settings: retry_backoff_multiplier must be >= 1.0"));
        return {};
    }

    Result<std::size_t> load_dotenv(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            return std::size_t{0};

        std::size_t applied = 0;
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            auto entry = trim(line);
            if (entry.empty() || entry.front() == '#')
                continue;
            if (entry.rfind("export ", 0) == 0)
                entry = trim(entry.substr(7));

            auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0)
                return std::unexpected(HermesError::config(path + ":" + std::to_string(line_no) + ": expected KEY=VALUE"));

            auto key = trim(entry.substr(0, eq));
            auto value = trim(entry.substr(eq + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
                value = value.substr(1, value.size() - 2);

            if (std::getenv(key.c_str()))
                continue;
            if (::setenv(key.c_str(), value.c_str(), 0) != 0)
                return std::unexpected(HermesError::io("Failed to set environment variable " + key));
            ++applied;
        }
        return applied;
    }

} // namespace hermes
