#include "hermes/json_util.hpp"

namespace hermes
{
    Result<nlohmann::json> parse_json(const std::string &text, int max_depth)
    {
        using event_t = nlohmann::json::parse_event_t;

        bool too_deep = false;
        // depth is the number of open containers above the one being started
        nlohmann::json::parser_callback_t limit = [&](int depth, event_t event, nlohmann::json &)
        {
            if ((event == event_t::object_start || event == event_t::array_start) && depth >= max_depth)
            {
                too_deep = true;
                return false;
            }
            return true;
        };

        nlohmann::json value;
        try
        {
            value = nlohmann::json::parse(text, limit);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return std::unexpected(HermesError::invalid_input(e.what()));
        }

        if (too_deep)
        {
            return std::unexpected(HermesError::invalid_input("nesting depth exceeds " +
                                                              std::to_string(max_depth)));
        }
        return value;
    }

} // namespace hermes
