#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace hermes
{
    /** Opaque reference to a template compiled by a TemplateRenderer. */
    struct TemplateHandle
    {
        std::size_t id{0};
        std::string name;
    };

    /**
     * Narrow interface over a logic-less template engine. Templates are
     * compiled once at startup; render() is const and safe to call from
     * any number of threads once compilation is over.
     */
    class TemplateRenderer
    {
    public:
        virtual ~TemplateRenderer() = default;

        virtual Result<TemplateHandle> compile(const std::string &name, const std::string &source) = 0;

        virtual Result<std::string> render(const TemplateHandle &handle, const nlohmann::json &data) const = 0;
    };

    struct RenderOptions
    {
        bool strict{false}; // missing variables fail the render instead of printing nothing
    };

    /**
     * Handlebars/Mustache-subset engine: escaped and raw substitution,
     * comments, whitespace control, #if/#unless/#each/#with blocks with
     * {{else}}, dotted/indexed paths, ../ and @root, loop data variables and
     * the inline `json` helper. Templates cannot call out of the engine.
     */
    class MustacheRenderer : public TemplateRenderer
    {
    public:
        explicit MustacheRenderer(RenderOptions options = {});
        ~MustacheRenderer() override;

        MustacheRenderer(const MustacheRenderer &) = delete;
        MustacheRenderer &operator=(const MustacheRenderer &) = delete;

        Result<TemplateHandle> compile(const std::string &name, const std::string &source) override;

        Result<std::string> render(const TemplateHandle &handle, const nlohmann::json &data) const override;

        std::size_t size() const { return templates_.size(); }

        struct Template;

    private:
        RenderOptions options_;
        std::vector<std::unique_ptr<const Template>> templates_;
    };

    /**
     * Template data for an inbound payload: objects are used as-is, any other
     * JSON value is wrapped as {"data": value}.
     */
    nlohmann::json to_template_data(nlohmann::json value);

} // namespace hermes
