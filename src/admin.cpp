#include "hermes/admin.hpp"
#include "hermes/endpoint_registry.hpp"
#include "hermes/json_util.hpp"
#include "hermes/logging.hpp"
#include "hermes/template_engine.hpp"
#include <algorithm>
#include <iomanip>

namespace hermes::admin
{
    Result<void> validate_config(const RelayConfig &cfg)
    {
        logging::category("admin")->info("Validating {} webhook registers", cfg.registers.size());

        auto valid = ConfigLoader::validate(cfg);
        if (!valid)
            return valid;

        auto registry = EndpointRegistry::build(cfg);
        if (!registry)
            return std::unexpected(registry.error());
        return {};
    }

    Result<TemplateTestResult> test_template(const RelayConfig &cfg, const std::string &endpoint,
                                             const std::string &payload)
    {
        auto reg = std::find_if(cfg.registers.begin(), cfg.registers.end(),
                                [&](const RegisterConfig &r)
                                { return r.endpoint == endpoint; });
        if (reg == cfg.registers.end())
            return std::unexpected(HermesError::not_found("Endpoint '" + endpoint + "' not found"));

        auto data = parse_json(payload);
        if (!data)
            return std::unexpected(HermesError::invalid_input(std::string("Invalid JSON payload: ") + data.error().what()));

        MustacheRenderer renderer(RenderOptions{cfg.settings.strict_templates});
        auto handle = renderer.compile("test", reg->template_source);
        if (!handle)
            return std::unexpected(handle.error());

        auto rendered = renderer.render(*handle, to_template_data(std::move(*data)));
        if (!rendered)
            return std::unexpected(rendered.error());

        TemplateTestResult out{};
        out.rendered = std::move(*rendered);
        if (auto parsed = parse_json(out.rendered); !parsed)
            out.json_error = parsed.error().what();
        return out;
    }

    void list_endpoints(const RelayConfig &cfg, std::ostream &out)
    {
        out << "Registered webhook endpoints:\n";
        out << std::left << std::setw(8) << "METHOD" << ' ' << std::setw(30) << "ENDPOINT" << ' ' << std::setw(8)
            << "TARGET" << ' ' << "URL" << '\n';
        out << std::string(80, '-') << '\n';
        for (const auto &reg : cfg.registers)
        {
            out << std::left << std::setw(8) << reg.method << ' ' << std::setw(30) << reg.endpoint << ' '
                << std::setw(8) << reg.target.method << ' ' << reg.target.url << '\n';
        }
    }

} // namespace hermes::admin
