#pragma once

#include "config.hpp"
#include "types.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace hermes::admin
{
    struct TemplateTestResult
    {
        std::string rendered;
        std::optional<std::string> json_error; // set when the output does not parse as JSON
    };

    /**
     * Full validation of a loaded config: schema rules from
     * ConfigLoader::validate, then template compilation for every register.
     */
    Result<void> validate_config(const RelayConfig &cfg);

    /**
     * Render the template of `endpoint` against `payload` exactly as the
     * dispatcher would (non-object payloads are wrapped as {"data": ..}).
     */
    Result<TemplateTestResult> test_template(const RelayConfig &cfg, const std::string &endpoint,
                                             const std::string &payload);

    /** Print the METHOD / ENDPOINT / TARGET / URL table. */
    void list_endpoints(const RelayConfig &cfg, std::ostream &out);

} // namespace hermes::admin
