/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_RESOLVE_HPP_INCLUDED
#define TAGSMITH_RESOLVE_HPP_INCLUDED

#include <tagsmith/ast.hpp>
#include <tagsmith/context.hpp>
#include <optional>

namespace tagsmith
{
    enum class match
    {
        exact,
        generic,
        innermost
    };

    struct resolved
    {
        match kind;
        ast::binding const* source;
        std::string_view site; // `ast::generic_site` for a generic match.
        std::string_view attribute;
        // Null means: show `attribute` for exact and innermost matches, show
        // nothing for a generic one.
        ast::content_list const* display;
    };

    // Picks the binding of `chain` that applies at `target`: an exact site
    // match first, then the generic binding, then (for user chains only)
    // the innermost binding linked against its own site.
    TAGSMITH_API std::optional<resolved> resolve(ast::chain const& chain, bool users, std::string_view target) noexcept;

    TAGSMITH_API bool evaluate(ast::conditional const& cond, std::string_view target, flag_set const& defines) noexcept;

    inline bool evaluate(ast::conditional const& cond, render_context const& ctx) noexcept
    {
        return evaluate(cond, ctx.target.name, ctx.defines);
    }

    // The chain `[self][/self]` stands for: one binding per configured site.
    TAGSMITH_API ast::chain self_chain(user_config const& users);
}

#endif
