#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hermes
{
    /** Deepest array/object nesting accepted from request or response bodies. */
    inline constexpr int kMaxJsonDepth = 128;

    /**
     * Parse untrusted JSON text. Fails with InvalidInput carrying the parser's
     * message, or a nesting message when containers go deeper than max_depth.
     * Rejected nesting is never materialized.
     */
    Result<nlohmann::json> parse_json(const std::string &text, int max_depth = kMaxJsonDepth);

} // namespace hermes
