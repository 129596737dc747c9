#include "hermes/url.hpp"
#include <algorithm>
#include <cctype>

namespace hermes
{
    std::string Url::host_header() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (explicit_port)
            h += ":" + port;
        return h;
    }

    Result<Url> Url::parse(std::string_view text)
    {
        Url url;
        auto scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos)
            return std::unexpected(HermesError::invalid_input("URL must be absolute: " + std::string(text)));

        url.scheme = std::string(text.substr(0, scheme_end));
        std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (url.scheme != "http" && url.scheme != "https")
            return std::unexpected(HermesError::invalid_input("Unsupported URL scheme: " + url.scheme));

        auto rest = text.substr(scheme_end + 3);
        auto authority_end = rest.find_first_of("/?#");
        auto authority = rest.substr(0, authority_end);
        auto remainder = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

        if (authority.find('@') != std::string_view::npos)
            return std::unexpected(HermesError::invalid_input("Credentials in URL are not supported"));
        if (authority.empty())
            return std::unexpected(HermesError::invalid_input("URL has no host: " + std::string(text)));

        std::string_view port;
        if (authority.front() == '[')
        {
            auto close = authority.find(']');
            if (close == std::string_view::npos)
                return std::unexpected(HermesError::invalid_input("Unterminated IPv6 literal in URL"));
            url.host = std::string(authority.substr(1, close - 1));
            auto after = authority.substr(close + 1);
            if (!after.empty())
            {
                if (after.front() != ':')
                    return std::unexpected(HermesError::invalid_input("Malformed URL authority"));
                port = after.substr(1);
            }
        }
        else
        {
            auto colon = authority.rfind(':');
            url.host = std::string(authority.substr(0, colon));
            if (colon != std::string_view::npos)
                port = authority.substr(colon + 1);
        }

        if (url.host.empty())
            return std::unexpected(HermesError::invalid_input("URL has no host: " + std::string(text)));

        if (!port.empty())
        {
            bool digits = std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); });
            if (!digits || port.size() > 5 || std::stoul(std::string(port)) > 65535 || std::stoul(std::string(port)) == 0)
                return std::unexpected(HermesError::invalid_input("Invalid port in URL: " + std::string(port)));
            url.port = std::string(port);
            url.explicit_port = true;
        }
        else
        {
            url.port = url.is_tls() ? "443" : "80";
        }

        // fragments never go on the wire
        auto fragment = remainder.find('#');
        if (fragment != std::string_view::npos)
            remainder = remainder.substr(0, fragment);

        if (remainder.empty())
            url.target = "/";
        else if (remainder.front() == '?')
            url.target = "/" + std::string(remainder);
        else
            url.target = std::string(remainder);

        return url;
    }

} // namespace hermes
