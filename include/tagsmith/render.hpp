/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_RENDER_HPP_INCLUDED
#define TAGSMITH_RENDER_HPP_INCLUDED

#include <tagsmith/description.hpp>
#include <tagsmith/context.hpp>
#include <string>

namespace tagsmith
{
    enum class gap_kind
    {
        no_binding, // A [siteurl] chain with nothing for the target site.
        no_user     // [self] at a site without a configured username.
    };

    // Content a render pass left out. The pass itself carries on.
    struct gap
    {
        gap_kind kind;
        std::string_view target;
        ast::chain const* chain; // Null for `no_user`.
    };

    using gap_handler = fn_ptr<void(gap const&)>;

    TAGSMITH_API std::string to_message(gap const& g);
}

namespace tagsmith::detail
{
    TAGSMITH_API void render
    (
        output_handler os, description const& desc,
        render_context const& ctx, gap_handler f
    );
}

namespace tagsmith
{
    template<class Sink>
    inline void render
    (
        Sink&& os, description const& desc,
        render_context const& ctx, gap_handler f = nullptr
    )
    {
        detail::render(os, desc, ctx, f);
    }
}

#endif
