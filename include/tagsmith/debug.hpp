/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_DEBUG_HPP_INCLUDED
#define TAGSMITH_DEBUG_HPP_INCLUDED

#include <iostream>
#include <iomanip>
#include <tagsmith/description.hpp>

namespace tagsmith::detail
{
    constexpr char const* get_tag_str(ast::type tag)
    {
        switch (tag)
        {
        case ast::type::bold: return "(b)";
        case ast::type::italic: return "(i)";
        case ast::type::underline: return "(u)";
        case ast::type::user_switch: return "(user)";
        case ast::type::siteurl_switch: return "(siteurl)";
        default: break;
        }
        return "";
    }

    constexpr char const* get_relation_str(ast::relation op)
    {
        switch (op)
        {
        case ast::relation::eq: return " == ";
        case ast::relation::ne: return " != ";
        case ast::relation::in: return " in ";
        }
        return "";
    }

    template<class CharT, class Traits>
    struct ast_printer
    {
        ast::context const& ctx;
        std::basic_ostream<CharT, Traits>& out;
        unsigned level;
        unsigned const space;

        void write_text(std::string_view s) const
        {
            auto i = s.data();
            auto i0 = i;
            auto const e = i + s.size();
            out << '"';
            while (i != e)
            {
                char const* esc = nullptr;
                switch (*i)
                {
                case '\r': esc = "\\r"; break;
                case '\n': esc = "\\n"; break;
                case '\\': esc = "\\\\"; break;
                default: ++i; continue;
                }
                out.write(i0, i - i0);
                i0 = ++i;
                out << esc;
            }
            out.write(i0, i - i0);
            out << '"';
        }

        void nested(ast::content_list const& contents)
        {
            ++level;
            for (auto const& content : contents)
                ctx.visit(*this, content);
            --level;
        }

        void operator()(ast::type, ast::text const* text) const
        {
            indent();
            out << "text: ";
            write_text(*text);
            out << "\n";
        }

        void operator()(ast::type tag, ast::block const* block)
        {
            indent();
            out << "format" << get_tag_str(tag) << "\n";
            nested(block->contents);
        }

        void operator()(ast::type, ast::link const* link)
        {
            indent();
            out << "link: " << link->url << "\n";
            nested(link->contents);
        }

        void operator()(ast::type tag, ast::chain const* chain)
        {
            indent();
            out << "switch" << get_tag_str(tag) << "\n";
            ++level;
            for (auto const& b : chain->bindings)
            {
                indent();
                out << b.site << ": " << b.attribute << "\n";
                nested(b.display);
            }
            --level;
        }

        void operator()(ast::type, ast::conditional const* cond)
        {
            indent();
            out << "if: " << (cond->lhs == ast::param::site ? "site" : "define") << get_relation_str(cond->op);
            char const* sep = "";
            for (auto const& operand : cond->operands)
            {
                out << sep << operand;
                sep = ",";
            }
            out << "\n";
            nested(cond->then_branch);
            if (cond->has_else)
            {
                indent();
                out << "else:\n";
                nested(cond->else_branch);
            }
        }

        void operator()(ast::type tag, void const*) const
        {
            if (tag == ast::type::self)
            {
                indent();
                out << "self\n";
            }
        }

        void indent() const
        {
            out << std::setw(space * level) << "";
        }
    };
}

namespace tagsmith
{
    template<class CharT, class Traits>
    inline void print_ast(std::basic_ostream<CharT, Traits>& out, description const& desc, unsigned indent = 4)
    {
        auto const& doc = desc.doc();
        detail::ast_printer<CharT, Traits> visitor{doc.ctx, out, 0, indent};
        for (auto const& content : doc.contents)
            doc.ctx.visit(visitor, content);
    }
}

#endif
