#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace hermes::logging
{
    enum class LogFormat
    {
        Pretty,
        Json
    };

    /** Parse "trace", "debug", "info", "warn", "error", "critical" or "off". */
    Result<spdlog::level::level_enum> parse_level(const std::string &name);

    /** Parse "pretty" or "json". */
    Result<LogFormat> parse_format(const std::string &name);

    /**
     * Install the process-wide "hermes" logger on a colored stdout sink.
     * Json format writes one object per line with UTC timestamps. Category
     * loggers created before or after this call share its sink, level and
     * pattern.
     */
    void init(spdlog::level::level_enum level, LogFormat format);

    /**
     * Retrieve or create a logger for a subsystem ("server", "dispatch",
     * "forward", "config", "admin"). Safe to call before init().
     */
    std::shared_ptr<spdlog::logger> category(const std::string &name);

} // namespace hermes::logging
