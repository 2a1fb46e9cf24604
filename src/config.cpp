/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/config.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace tagsmith::detail { namespace
{
    std::string join(std::vector<std::string> const& errors)
    {
        std::string ret("invalid configuration");
        char const* sep = ": ";
        for (auto const& e : errors)
        {
            ret += sep;
            ret += e;
            sep = "; ";
        }
        return ret;
    }
}}

namespace tagsmith
{
    config_error::config_error(std::vector<std::string> errors)
      : runtime_error(detail::join(errors)), _errors(std::move(errors))
    {}

    user_config parse_config(std::string_view text, site_registry const& sites, warning_handler warn)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(text);
        }
        catch (nlohmann::json::parse_error const& e)
        {
            throw config_error({detail::fmt::format("malformed JSON: {}", e.what())});
        }
        if (!json.is_object())
            throw config_error({"configuration must be a JSON object"});

        std::vector<std::string> errors;
        user_config ret;
        for (auto const& item : json.items())
        {
            auto const& key = item.key();
            auto const& value = item.value();
            auto const s = sites.find(key);
            if (!s)
            {
                if (warn)
                    warn(detail::fmt::format("ignoring unknown configuration key \"{}\"", key));
                continue;
            }
            if (!value.is_string())
            {
                errors.push_back(detail::fmt::format("website \"{}\" has invalid username {}", key, value.dump()));
                continue;
            }
            auto const user = trim(value.get_ref<std::string const&>());
            if (user.empty())
                errors.push_back(detail::fmt::format("website \"{}\" has empty username", key));
            else if (!s->accepts(user))
                errors.push_back(detail::fmt::format("website \"{}\" has invalid username \"{}\"", key, user));
            else if (!ret.emplace(std::string(s->name), std::string(user)).second)
                errors.push_back(detail::fmt::format("duplicate entry for website \"{}\" (key \"{}\")", s->name, key));
        }
        if (errors.empty() && ret.empty())
            errors.push_back("no valid websites defined");
        if (!errors.empty())
            throw config_error(std::move(errors));
        return ret;
    }

    bool is_flag(std::string_view option) noexcept
    {
        return !option.empty() && std::all_of(option.begin(), option.end(), [](char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '_' || c == '-';
        });
    }

    flag_set make_flags(std::vector<std::string> const& options, warning_handler warn)
    {
        std::vector<std::string> errors;
        flag_set ret;
        for (auto const& option : options)
        {
            if (!is_flag(option))
                errors.push_back(detail::fmt::format("option \"{}\" may only contain letters, digits, '_' and '-'", option));
            else if (!ret.insert(option).second && warn)
                warn(detail::fmt::format("option \"{}\" is defined more than once", option));
        }
        if (!errors.empty())
            throw config_error(std::move(errors));
        return ret;
    }
}
