/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_AST_HPP_INCLUDED
#define TAGSMITH_AST_HPP_INCLUDED

#include <vector>
#include <string>
#include <string_view>

namespace tagsmith::ast
{
    enum class type
    {
        null,
        text,
        bold,
        italic,
        underline,
        link,
        self,
        user_switch,
        siteurl_switch,
        conditional
    };

    struct content
    {
        type kind = type::null;
        unsigned index = 0;

        bool is_null() const { return kind == type::null; }

        bool operator==(content const&) const = default;
    };

    using text = std::string_view;

    using content_list = std::vector<content>;

    // Name a binding uses instead of a site to mark the catch-all entry.
    inline constexpr std::string_view generic_site = "generic";

    struct block
    {
        content_list contents;

        bool operator==(block const&) const = default;
    };

    struct link
    {
        std::string url;
        content_list contents;

        bool operator==(link const&) const = default;
    };

    struct binding
    {
        std::string site; // Canonical site name, or `generic_site`.
        std::string attribute;
        content_list display;

        bool is_generic() const { return site == generic_site; }

        bool operator==(binding const&) const = default;
    };

    // Bindings are ordered from the outermost tag to the innermost one.
    struct chain
    {
        std::vector<binding> bindings;

        binding const* find(std::string_view site) const
        {
            for (auto const& b : bindings)
            {
                if (b.site == site)
                    return &b;
            }
            return nullptr;
        }

        binding const* generic() const
        {
            return find(generic_site);
        }

        binding const& innermost() const
        {
            return bindings.back();
        }

        // Only the innermost tag may wrap display text, and the text of a
        // generic tag belongs to that tag alone.
        content_list const* display_override() const
        {
            if (bindings.empty())
                return nullptr;
            auto const& b = bindings.back();
            if (b.is_generic() || b.display.empty())
                return nullptr;
            return &b.display;
        }

        bool operator==(chain const&) const = default;
    };

    enum class param
    {
        site,
        define
    };

    enum class relation
    {
        eq,
        ne,
        in
    };

    struct conditional
    {
        param lhs = param::site;
        relation op = relation::eq;
        std::vector<std::string> operands;
        content_list then_branch;
        content_list else_branch;
        bool has_else = false;

        bool operator==(conditional const&) const = default;
    };

    struct context
    {
        std::vector<text> texts;
        std::vector<block> blocks;
        std::vector<link> links;
        std::vector<chain> chains;
        std::vector<conditional> conditionals;

        content add(text node)
        {
            content ret{type::text, unsigned(texts.size())};
            texts.push_back(node);
            return ret;
        }

        content add(type kind, block&& node)
        {
            content ret{kind, unsigned(blocks.size())};
            blocks.push_back(std::move(node));
            return ret;
        }

        content add(link&& node)
        {
            content ret{type::link, unsigned(links.size())};
            links.push_back(std::move(node));
            return ret;
        }

        content add(type kind, chain&& node)
        {
            content ret{kind, unsigned(chains.size())};
            chains.push_back(std::move(node));
            return ret;
        }

        content add(conditional&& node)
        {
            content ret{type::conditional, unsigned(conditionals.size())};
            conditionals.push_back(std::move(node));
            return ret;
        }

        struct mark
        {
            std::size_t texts, blocks, links, chains, conditionals;
        };

        mark checkpoint() const noexcept
        {
            return {texts.size(), blocks.size(), links.size(), chains.size(), conditionals.size()};
        }

        // Drop every node added after `m`; used when a subtree is consumed
        // as an attribute instead of kept as content.
        void rollback(mark const& m)
        {
            texts.resize(m.texts);
            blocks.resize(m.blocks);
            links.resize(m.links);
            chains.resize(m.chains);
            conditionals.resize(m.conditionals);
        }

        bool operator==(context const&) const = default;

    public:
        template<class F>
        auto visit(F&& f, content c) const -> decltype(auto)
        {
            switch (c.kind)
            {
            case type::null:
            case type::self:
                return f(c.kind, static_cast<void const*>(nullptr));
            case type::text: return f(c.kind, texts.data() + c.index);
            case type::bold:
            case type::italic:
            case type::underline:
                return f(c.kind, blocks.data() + c.index);
            case type::link: return f(c.kind, links.data() + c.index);
            case type::user_switch:
            case type::siteurl_switch:
                return f(c.kind, chains.data() + c.index);
            case type::conditional: return f(c.kind, conditionals.data() + c.index);
            }
            return f(type::null, static_cast<void const*>(nullptr));
        }
    };

    struct document
    {
        context ctx;
        content_list contents;

        bool operator==(document const&) const = default;
    };
}

#endif
