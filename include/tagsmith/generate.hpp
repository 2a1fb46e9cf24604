/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_GENERATE_HPP_INCLUDED
#define TAGSMITH_GENERATE_HPP_INCLUDED

#include <tagsmith/render.hpp>
#include <string>
#include <vector>

namespace tagsmith
{
    struct site_output
    {
        site const* target;
        std::string text;
        std::vector<std::string> warnings;

        std::string_view file() const noexcept { return target->output; }
    };

    struct generate_options
    {
        bool parallel = false;
    };

    // Converts CRLF to LF, collapses blank-line runs to a single blank line,
    // trims the ends and appends one newline. Blank input stays empty.
    TAGSMITH_API std::string finalize(std::string_view text);

    TAGSMITH_API site_output generate_site(description const& desc, render_context const& ctx);

    // Renders `desc` for each site that has a username, in registry order.
    TAGSMITH_API std::vector<site_output> generate
    (
        description const& desc, user_config const& users, flag_set const& defines,
        site_registry const& sites = site_registry::builtin(), generate_options opts = {}
    );
}

#endif
