/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_TEST_FIXTURE_HPP_INCLUDED
#define TAGSMITH_TEST_FIXTURE_HPP_INCLUDED

#include <tagsmith/render/string.hpp>
#include <string>
#include <vector>

namespace test
{
    // Renders one site at a time and keeps the gap messages.
    struct renderer
    {
        tagsmith::user_config users;
        tagsmith::flag_set defines;
        mutable std::vector<std::string> gaps;

        std::string operator()(tagsmith::description const& desc, std::string_view site) const
        {
            auto const& sites = tagsmith::site_registry::builtin();
            tagsmith::render_context const ctx{sites, sites.get(site), users, defines};
            auto const report = [this](tagsmith::gap const& g)
            {
                gaps.push_back(tagsmith::to_message(g));
            };
            return tagsmith::to_string(desc, ctx, report);
        }
    };

    // -1 if `src` parses.
    inline int parse_code(std::string_view src)
    {
        try
        {
            tagsmith::description const desc(src);
        }
        catch (tagsmith::parse_error const& e)
        {
            return e.code();
        }
        return -1;
    }
}

#endif
