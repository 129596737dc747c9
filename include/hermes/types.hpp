#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace hermes
{

    /**
     * Error categories for Hermes operations. Each per-request category maps
     * to one HTTP status in the dispatcher.
     */
    enum class ErrorCode
    {
        ConfigError,
        ValidationError,
        NotFound,
        InvalidInput,
        TemplateCompileError,
        TemplateRenderError,
        RenderedPayloadNotJson,
        UnsupportedMethod,
        NetworkError,
        InternalError,
        IOError
    };

    /**
     * Hermes error with code and message
     */
    class HermesError : public std::runtime_error
    {
    public:
        ErrorCode code;

        HermesError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static HermesError config(const std::string &msg)
        {
            return HermesError(ErrorCode::ConfigError, msg);
        }

        static HermesError validation(const std::string &msg)
        {
            return HermesError(ErrorCode::ValidationError, msg);
        }

        static HermesError not_found(const std::string &msg)
        {
            return HermesError(ErrorCode::NotFound, msg);
        }

        static HermesError invalid_input(const std::string &msg)
        {
            return HermesError(ErrorCode::InvalidInput, msg);
        }

        static HermesError template_compile(const std::string &msg)
        {
            return HermesError(ErrorCode::TemplateCompileError, msg);
        }

        static HermesError template_render(const std::string &msg)
        {
            return HermesError(ErrorCode::TemplateRenderError, msg);
        }

        static HermesError rendered_not_json(const std::string &msg)
        {
            return HermesError(ErrorCode::RenderedPayloadNotJson, msg);
        }

        static HermesError unsupported_method(const std::string &msg)
        {
            return HermesError(ErrorCode::UnsupportedMethod, msg);
        }

        static HermesError network(const std::string &msg)
        {
            return HermesError(ErrorCode::NetworkError, msg);
        }

        static HermesError internal(const std::string &msg)
        {
            return HermesError(ErrorCode::InternalError, msg);
        }

        static HermesError io(const std::string &msg)
        {
            return HermesError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, HermesError>;

} // namespace hermes
