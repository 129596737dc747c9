#include "hermes/logging.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace hermes::logging
{
    namespace
    {
        constexpr const char *kPrettyPattern = "%Y-%m-%dT%H:%M:%S.%fZ %^%5l%$ %n: %v";
        constexpr const char *kJsonPattern =
            R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%fZ","level":"%l","target":"%n","thread":%t,"message":%*})";

        // %* : the message as a quoted, escaped JSON string
        class JsonMessageFlag : public spdlog::custom_flag_formatter
        {
        public:
            void format(const spdlog::details::log_msg &msg, const std::tm &, spdlog::memory_buf_t &dest) override
            {
                std::string payload(msg.payload.data(), msg.payload.size());
                auto quoted = nlohmann::json(payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
                dest.append(quoted.data(), quoted.data() + quoted.size());
            }

            std::unique_ptr<custom_flag_formatter> clone() const override
            {
                return std::make_unique<JsonMessageFlag>();
            }
        };

        std::mutex g_mutex;
        spdlog::sink_ptr g_sink;
        spdlog::level::level_enum g_level = spdlog::level::info;
        std::string g_pattern = kPrettyPattern;

        spdlog::sink_ptr shared_sink()
        {
            if (!g_sink)
                g_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            return g_sink;
        }

        void apply(const std::shared_ptr<spdlog::logger> &logger)
        {
            logger->set_level(g_level);
            auto formatter = std::make_unique<spdlog::pattern_formatter>(spdlog::pattern_time_type::utc);
            formatter->add_flag<JsonMessageFlag>('*').set_pattern(g_pattern);
            logger->set_formatter(std::move(formatter));
        }
    } // namespace

    Result<spdlog::level::level_enum> parse_level(const std::string &name)
    {
        if (name == "trace")
            return spdlog::level::trace;
        if (name == "debug")
            return spdlog::level::debug;
        if (name == "info")
            return spdlog::level::info;
        if (name == "warn" || name == "warning")
            return spdlog::level::warn;
        if (name == "error")
            return spdlog::level::err;
        if (name == "critical")
            return spdlog::level::critical;
        if (name == "off")
            return spdlog::level::off;
        return std::unexpected(HermesError::config("Invalid log level: " + name));
    }

    Result<LogFormat> parse_format(const std::string &name)
    {
        if (name == "pretty")
            return LogFormat::Pretty;
        if (name == "json")
            return LogFormat::Json;
        return std::unexpected(HermesError::config("Invalid log format: " + name + " (expected json or pretty)"));
    }

    void init(spdlog::level::level_enum level, LogFormat format)
    {
        std::lock_guard lock(g_mutex);
        g_level = level;
        g_pattern = format == LogFormat::Json ? kJsonPattern : kPrettyPattern;

        auto logger = spdlog::get("hermes");
        if (!logger)
        {
            logger = std::make_shared<spdlog::logger>("hermes", shared_sink());
            spdlog::register_logger(logger);
        }
        spdlog::set_default_logger(logger);

        // re-apply to every registered logger so category loggers follow suit
        spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &l) { apply(l); });
    }

    std::shared_ptr<spdlog::logger> category(const std::string &name)
    {
        std::lock_guard lock(g_mutex);
        if (auto existing = spdlog::get(name))
            return existing;

        auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
        apply(logger);
        spdlog::register_logger(logger);
        return logger;
    }

} // namespace hermes::logging
