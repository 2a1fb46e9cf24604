/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_CONTEXT_HPP_INCLUDED
#define TAGSMITH_CONTEXT_HPP_INCLUDED

#include <tagsmith/site.hpp>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace tagsmith
{
    using flag_set = std::set<std::string, std::less<>>;

    // Usernames keyed by canonical site name.
    struct user_config : std::map<std::string, std::string, std::less<>>
    {
        using map::map;

        std::string const* user(std::string_view site) const
        {
            auto it = find(site);
            return it == end() ? nullptr : &it->second;
        }
    };

    // Everything one render pass reads; nothing here changes while it runs.
    struct render_context
    {
        site_registry const& sites;
        site const& target;
        user_config const& users;
        flag_set const& defines;
    };
}

#endif
