/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/resolve.hpp>
#include <algorithm>

namespace tagsmith
{
    std::optional<resolved> resolve(ast::chain const& chain, bool users, std::string_view target) noexcept
    {
        if (chain.bindings.empty())
            return std::nullopt;
        auto const overriding = chain.display_override();
        if (auto const b = chain.find(target))
            return resolved{match::exact, b, b->site, b->attribute, overriding};
        if (auto const g = chain.generic())
        {
            auto const display = g->display.empty() ? overriding : &g->display;
            return resolved{match::generic, g, g->site, g->attribute, display};
        }
        if (users)
        {
            auto const& b = chain.innermost();
            return resolved{match::innermost, &b, b.site, b.attribute, overriding};
        }
        return std::nullopt;
    }

    bool evaluate(ast::conditional const& cond, std::string_view target, flag_set const& defines) noexcept
    {
        auto const holds = [&](std::string const& operand)
        {
            if (cond.lhs == ast::param::site)
                return operand == target;
            return defines.contains(operand);
        };
        auto const any = std::any_of(cond.operands.begin(), cond.operands.end(), holds);
        return cond.op == ast::relation::ne ? !any : any;
    }

    ast::chain self_chain(user_config const& users)
    {
        ast::chain ret;
        for (auto const& [site, user] : users)
            ret.bindings.push_back({site, user, {}});
        return ret;
    }
}
