#include "hermes/health.hpp"
#include <chrono>

#ifndef HERMES_VERSION
#define HERMES_VERSION "0.0.0"
#endif

namespace hermes
{
    namespace
    {
        std::int64_t unix_now()
        {
            using namespace std::chrono;
            return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
        }
    } // namespace

    std::string version()
    {
        return HERMES_VERSION;
    }

    nlohmann::json health_status()
    {
        return {{"status", "healthy"}, {"timestamp", unix_now()}, {"version", version()}, {"service", kServiceName}};
    }

    nlohmann::json readiness_status()
    {
        return {{"status", "ready"}, {"checks", {{"config", "ok"}}}};
    }

} // namespace hermes
