#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace hermes
{
    /** Name reported in the health document. */
    inline constexpr const char *kServiceName = "hermes-rs";

    /** Build version, e.g. "0.1.0". */
    std::string version();

    /** {"status":"healthy","timestamp":<unix seconds>,"version":..,"service":..} */
    nlohmann::json health_status();

    /** {"status":"ready","checks":{"config":"ok"}} */
    nlohmann::json readiness_status();

} // namespace hermes
