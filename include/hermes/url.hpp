#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace hermes
{
    /**
     * Absolute http/https URL split into the pieces the forwarding client
     * needs: resolver host/port and the request target (path plus query).
     */
    struct Url
    {
        std::string scheme; // "http" or "https", lower-cased
        std::string host;   // without IPv6 brackets
        std::string port;   // explicit or scheme default
        std::string target; // "/path?query", never empty
        bool explicit_port{false};

        bool is_tls() const { return scheme == "https"; }

        /** Value for the Host header (port only when given explicitly). */
        std::string host_header() const;

        static Result<Url> parse(std::string_view text);
    };

} // namespace hermes
