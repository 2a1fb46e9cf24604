/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#include <cassert>
#include <utility>
#include <cstring>
#include <exception>
#include <tagsmith/description.hpp>

namespace tagsmith::parser { namespace
{
    using I = char const*;

    constexpr bool is_space(char c)
    {
        switch (c)
        {
        case ' ':
        case '\f':
        case '\n':
        case '\r':
        case '\t':
        case '\v':
            return true;
        }
        return false;
    }

    constexpr bool is_alpha(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    constexpr bool is_digit(char c)
    {
        return c >= '0' && c <= '9';
    }

    constexpr bool is_name(char c)
    {
        return is_alpha(c) || is_digit(c) || c == '_';
    }

    constexpr bool is_ident(char c)
    {
        return is_name(c) || c == '-';
    }

    // Return true if it ends.
    inline bool skip(I& i, I e) noexcept
    {
        while (i != e)
        {
            if (!is_space(*i))
                return false;
            ++i;
        }
        return true;
    }

    inline bool parse_lit(I& i, I e, std::string_view str) noexcept
    {
        if (e - i < std::ptrdiff_t(str.size()))
            return false;
        I p = i;
        for (char c : str)
        {
            if (*p != c)
                return false;
            ++p;
        }
        i = p;
        return true;
    }

    // A '[' only opens a tag when a name or a '/' follows; otherwise it is text.
    inline bool at_tag(I i, I e) noexcept
    {
        if (i == e || *i != '[' || ++i == e)
            return false;
        return *i == '/' || is_alpha(*i);
    }

    std::string_view trim_front(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.front()))
            s.remove_prefix(1);
        return s;
    }

    std::string_view trim_back(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.back()))
            s.remove_suffix(1);
        return s;
    }

    struct tag
    {
        I start;
        std::string_view name;
        std::string_view attr;
        bool closing;
        bool has_attr;

        std::string str() const { return std::string(name); }
    };

    tag expect_tag(I b, I& i, I e)
    {
        tag ret{i, {}, {}, false, false};
        ++i;
        if (*i == '/')
        {
            ret.closing = true;
            ++i;
        }
        I const n0 = i;
        while (i != e && is_name(*i))
            ++i;
        ret.name = std::string_view(n0, i - n0);
        if (ret.name.empty())
            throw parse_error(error_tag, ret.start - b);
        if (!ret.closing && i != e && *i == '=')
        {
            I const a0 = ++i;
            while (i != e && *i != ']')
                ++i;
            ret.attr = trim(std::string_view(a0, i - a0));
            ret.has_attr = true;
        }
        if (i == e || *i != ']')
            throw parse_error(error_tag, ret.start - b, ret.str());
        ++i;
        return ret;
    }

    // Concatenates the text of `contents`, looking through formatting only.
    bool plain_text(ast::context const& ctx, ast::content_list const& contents, std::string& out)
    {
        for (auto const c : contents)
        {
            switch (c.kind)
            {
            case ast::type::text:
                out.append(ctx.texts[c.index]);
                break;
            case ast::type::bold:
            case ast::type::italic:
            case ast::type::underline:
                if (!plain_text(ctx, ctx.blocks[c.index].contents, out))
                    return false;
                break;
            default:
                return false;
            }
        }
        return true;
    }

    struct parser
    {
        ast::context& ctx;
        site_registry const& sites;

        void parse_start(I b, I& i, I e, ast::content_list& attr)
        {
            parse_contents(b, i, e, attr, nullptr);
        }

        void parse_contents(I b, I& i, I e, ast::content_list& attr, tag const* open);

        ast::content expect_element(I b, I& i, I e, tag const& t);

        ast::content expect_block(I b, I& i, I e, tag const& t, ast::type kind)
        {
            no_attr(b, t);
            ast::block a;
            parse_contents(b, i, e, a.contents, &t);
            return ctx.add(kind, std::move(a));
        }

        ast::content expect_link(I b, I& i, I e, tag const& t);

        ast::content expect_self(I b, I& i, I e, tag const& t)
        {
            no_attr(b, t);
            ast::content_list children;
            parse_contents(b, i, e, children, &t);
            if (!children.empty())
                throw parse_error(error_self_content, t.start - b, t.str());
            return {ast::type::self, 0};
        }

        ast::content expect_wrapper(I b, I& i, I e, tag const& t, ast::type kind);

        void expect_binding(I b, I& i, I e, tag const& t, ast::chain& chain, bool users);

        bool expect_nested(I b, I& i, I e, tag const& t, ast::chain& chain, bool users);

        void check_display(I b, tag const& t, ast::content_list const& display) const;

        void trim_display(ast::content_list& display);

        ast::content expect_conditional(I b, I& i, I e, tag const& t);

        void parse_condition(I b, tag const& t, ast::conditional& attr) const;

        bool is_switch(std::string_view name) const
        {
            return name == ast::generic_site || sites.find(name);
        }

        // Site aliases close case-insensitively; keywords must match exactly.
        bool closes(tag const& open, std::string_view name) const
        {
            if (is_switch(open.name))
                return iequals(open.name, name);
            return open.name == name;
        }

        std::string canonical(std::string_view name) const
        {
            if (name == ast::generic_site)
                return std::string(name);
            return std::string(sites.get(name).name);
        }

        static void no_attr(I b, tag const& t)
        {
            if (t.has_attr)
                throw parse_error(error_attribute, t.start - b, t.str());
        }

        void expect_close(I b, I& i, I e, tag const& t) const
        {
            if (!at_tag(i, e))
                throw parse_error(error_switch_content, i - b, t.str());
            auto const end = expect_tag(b, i, e);
            if (!end.closing)
                throw parse_error(error_switch_content, end.start - b, end.str());
            if (!closes(t, end.name))
                throw parse_error(error_mismatched, end.start - b, end.str());
        }
    };

    void parser::parse_contents(I b, I& i, I e, ast::content_list& attr, tag const* open)
    {
        for (;;)
        {
            I const i0 = i;
            while (i != e && !at_tag(i, e))
                ++i;
            if (i != i0)
                attr.push_back(ctx.add(ast::text(i0, i - i0)));
            if (i == e)
            {
                if (open)
                    throw parse_error(error_unclosed, open->start - b, open->str());
                return;
            }
            auto const t = expect_tag(b, i, e);
            if (t.closing)
            {
                if (!open || !closes(*open, t.name))
                    throw parse_error(error_mismatched, t.start - b, t.str());
                return;
            }
            attr.push_back(expect_element(b, i, e, t));
        }
    }

    ast::content parser::expect_element(I b, I& i, I e, tag const& t)
    {
        auto const& name = t.name;
        if (name == "b")
            return expect_block(b, i, e, t, ast::type::bold);
        if (name == "i")
            return expect_block(b, i, e, t, ast::type::italic);
        if (name == "u")
            return expect_block(b, i, e, t, ast::type::underline);
        if (name == "url")
            return expect_link(b, i, e, t);
        if (name == "self")
            return expect_self(b, i, e, t);
        if (name == "user")
            return expect_wrapper(b, i, e, t, ast::type::user_switch);
        if (name == "siteurl")
            return expect_wrapper(b, i, e, t, ast::type::siteurl_switch);
        if (name == "if")
            return expect_conditional(b, i, e, t);
        if (name == "else")
            throw parse_error(error_orphan_else, t.start - b, t.str());
        if (is_switch(name))
        {
            // A chain outside any wrapper links to users.
            ast::chain a;
            expect_binding(b, i, e, t, a, true);
            return ctx.add(ast::type::user_switch, std::move(a));
        }
        throw parse_error(error_unknown_tag, t.start - b, t.str());
    }

    ast::content parser::expect_link(I b, I& i, I e, tag const& t)
    {
        ast::link a;
        parse_contents(b, i, e, a.contents, &t);
        if (t.attr.empty())
        {
            std::string url;
            if (!plain_text(ctx, a.contents, url) || is_blank(url))
                throw parse_error(error_attribute, t.start - b, t.str());
            a.url = trim(url);
        }
        else
            a.url = t.attr;
        return ctx.add(std::move(a));
    }

    ast::content parser::expect_wrapper(I b, I& i, I e, tag const& t, ast::type kind)
    {
        no_attr(b, t);
        if (!at_tag(i, e))
            throw parse_error(error_switch_content, i - b, t.str());
        auto const inner = expect_tag(b, i, e);
        if (inner.closing || !is_switch(inner.name))
            throw parse_error(error_switch_content, inner.start - b, inner.str());
        ast::chain a;
        expect_binding(b, i, e, inner, a, kind == ast::type::user_switch);
        expect_close(b, i, e, t);
        return ctx.add(kind, std::move(a));
    }

    void parser::expect_binding(I b, I& i, I e, tag const& t, ast::chain& chain, bool users)
    {
        auto site = canonical(t.name);
        if (chain.find(site))
            throw parse_error(error_duplicate_site, t.start - b, t.str());
        auto const index = chain.bindings.size();
        chain.bindings.push_back({std::move(site), std::string(t.attr), {}});

        if (!expect_nested(b, i, e, t, chain, users))
        {
            auto const mark = ctx.checkpoint();
            ast::content_list display;
            parse_contents(b, i, e, display, &t);
            check_display(b, t, display);
            auto& bound = chain.bindings[index];
            if (bound.attribute.empty())
            {
                if (bound.is_generic())
                    throw parse_error(error_attribute, t.start - b, t.str());
                std::string text;
                if (!plain_text(ctx, display, text) || is_blank(text))
                    throw parse_error(error_attribute, t.start - b, t.str());
                bound.attribute = trim(text);
                ctx.rollback(mark);
            }
            else
            {
                trim_display(display);
                std::string text;
                if (plain_text(ctx, display, text) && is_blank(text))
                    ctx.rollback(mark);
                else
                    bound.display = std::move(display);
            }
        }
        auto const& bound = chain.bindings[index];
        if (users && !bound.is_generic() && !sites.get(bound.site).accepts(bound.attribute))
            throw parse_error(error_username, t.start - b, t.str());
    }

    // Return true if the tag held a nested switch tag, consumed through the
    // closing tag of `t`.
    bool parser::expect_nested(I b, I& i, I e, tag const& t, ast::chain& chain, bool users)
    {
        if (!at_tag(i, e))
            return false;
        I const i0 = i;
        auto const inner = expect_tag(b, i, e);
        if (inner.closing || !is_switch(inner.name))
        {
            i = i0;
            return false;
        }
        if (t.attr.empty())
            throw parse_error(error_attribute, t.start - b, t.str());
        expect_binding(b, i, e, inner, chain, users);
        expect_close(b, i, e, t);
        return true;
    }

    void parser::check_display(I b, tag const& t, ast::content_list const& display) const
    {
        for (auto const c : display)
        {
            switch (c.kind)
            {
            case ast::type::link:
            case ast::type::self:
            case ast::type::user_switch:
            case ast::type::siteurl_switch:
                throw parse_error(error_switch_content, t.start - b, t.str());
            case ast::type::bold:
            case ast::type::italic:
            case ast::type::underline:
                check_display(b, t, ctx.blocks[c.index].contents);
                break;
            case ast::type::conditional:
            {
                auto const& cond = ctx.conditionals[c.index];
                check_display(b, t, cond.then_branch);
                check_display(b, t, cond.else_branch);
                break;
            }
            default:
                break;
            }
        }
    }

    void parser::trim_display(ast::content_list& display)
    {
        while (!display.empty() && display.front().kind == ast::type::text)
        {
            auto& text = ctx.texts[display.front().index];
            text = trim_front(text);
            if (!text.empty())
                break;
            display.erase(display.begin());
        }
        while (!display.empty() && display.back().kind == ast::type::text)
        {
            auto& text = ctx.texts[display.back().index];
            text = trim_back(text);
            if (!text.empty())
                break;
            display.pop_back();
        }
    }

    ast::content parser::expect_conditional(I b, I& i, I e, tag const& t)
    {
        ast::conditional a;
        parse_condition(b, t, a);
        parse_contents(b, i, e, a.then_branch, &t);
        // Only an `[else]` touching `[/if]` belongs to it.
        I const i0 = i;
        if (parse_lit(i, e, "[else]"))
        {
            tag const open{i0, "else", {}, false, false};
            parse_contents(b, i, e, a.else_branch, &open);
            a.has_else = true;
        }
        return ctx.add(std::move(a));
    }

    void parser::parse_condition(I b, tag const& t, ast::conditional& attr) const
    {
        auto const pos = t.start - b;
        I i = t.attr.data();
        I const e = i + t.attr.size();
        if (skip(i, e))
            throw parse_error(error_condition, pos, t.str());

        I const p0 = i;
        while (i != e && is_name(*i))
            ++i;
        std::string_view const param(p0, i - p0);
        if (param == "site")
            attr.lhs = ast::param::site;
        else if (param == "define")
            attr.lhs = ast::param::define;
        else
            throw parse_error(error_param, pos, std::string(param));

        skip(i, e);
        if (parse_lit(i, e, "=="))
            attr.op = ast::relation::eq;
        else if (parse_lit(i, e, "!="))
            attr.op = ast::relation::ne;
        else if (parse_lit(i, e, "in") && i != e && is_space(*i))
            attr.op = ast::relation::in;
        else
            throw parse_error(error_condition, pos, t.str());

        for (;;)
        {
            skip(i, e);
            I const o0 = i;
            while (i != e && is_ident(*i))
                ++i;
            if (i == o0)
                throw parse_error(error_condition, pos, t.str());
            std::string_view const id(o0, i - o0);
            if (attr.lhs == ast::param::site)
            {
                auto const s = sites.find(id);
                if (!s)
                    throw parse_error(error_site, pos, std::string(id));
                attr.operands.emplace_back(s->name);
            }
            else
                attr.operands.emplace_back(id);
            if (skip(i, e))
                return;
            if (attr.op != ast::relation::in || *i != ',')
                throw parse_error(error_condition, pos, t.str());
            ++i;
        }
    }
}}

namespace tagsmith
{
    static char const* get_error_string(error_type err) noexcept
    {
        switch (err)
        {
        case error_tag:
            return "malformed tag";
        case error_unknown_tag:
            return "unknown tag";
        case error_unclosed:
            return "unclosed tag";
        case error_mismatched:
            return "mismatched closing tag";
        case error_self_content:
            return "self tag must be empty";
        case error_switch_content:
            return "switch tag must contain a single switch tag or display text";
        case error_duplicate_site:
            return "duplicate site in switch chain";
        case error_attribute:
            return "missing or unexpected attribute";
        case error_username:
            return "invalid username for site";
        case error_orphan_else:
            return "else tag must directly follow an if tag";
        case error_condition:
            return "invalid condition";
        case error_param:
            return "unknown condition parameter";
        case error_site:
            return "unknown site in condition";
        default:
            assert(!"should not happen");
            std::terminate();
        }
    }

    static std::string make_message(error_type err, std::string const& tag)
    {
        std::string msg(get_error_string(err));
        if (!tag.empty())
        {
            msg += ": ";
            msg += tag;
        }
        return msg;
    }

    parse_error::parse_error(error_type err, std::ptrdiff_t pos, std::string tag)
      : runtime_error(make_message(err, tag)), _err(err), _pos(pos), _tag(std::move(tag))
    {}

    void description::init(char const* begin, char const* end, site_registry const& sites)
    {
        parser::parser{_doc.ctx, sites}.parse_start(begin, begin, end, _doc.contents);
    }

    std::size_t description::text_size() const noexcept
    {
        std::size_t n = 0;
        for (auto const& text : _doc.ctx.texts)
            n += text.size();
        return n;
    }

    void description::copy_text(std::size_t n)
    {
        if (n)
        {
            auto data = new char[n];
            _text.reset(data);
            for (auto& text : _doc.ctx.texts)
            {
                auto n = text.size();
                std::memcpy(data, text.data(), n);
                text = {data, n};
                data += n;
            }
        }
    }
}
