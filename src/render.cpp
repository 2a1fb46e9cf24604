/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/render.hpp>
#include <tagsmith/resolve.hpp>

namespace tagsmith::detail
{
    struct content_visitor
    {
        using result_type = void;

        ast::context const& ctx;
        render_context const& rc;
        ast::chain const self;
        output_handler os;
        gap_handler report;

        content_visitor
        (
            ast::context const& ctx, render_context const& rc,
            output_handler os, gap_handler f
        )
            : ctx(ctx), rc(rc), self(self_chain(rc.users)), os(os), report(f)
        {}

        content_visitor(content_visitor const&) = delete;

        markup const& style() const
        {
            return *rc.target.style;
        }

        void expand(ast::content_list const& contents)
        {
            for (auto const content : contents)
                ctx.visit(*this, content);
        }

        // Renders `contents` into a string instead of the current sink.
        std::string capture(ast::content_list const& contents)
        {
            std::string buf;
            auto const sink = [&buf](char const* data, std::size_t bytes)
            {
                buf.append(data, bytes);
            };
            auto const old_os = os;
            os = sink;
            expand(contents);
            os = old_os;
            return buf;
        }

        void write_link(std::string_view url, ast::content_list const* display)
        {
            std::string text;
            if (display)
                text = capture(*display);
            style().link(os, url, text);
        }

        void write_user(resolved const& r);

        void write_url(resolved const& r);

        void operator()(ast::type, ast::text const* text)
        {
            os(text->data(), text->size());
        }

        void operator()(ast::type tag, ast::block const* block);

        void operator()(ast::type, ast::link const* link)
        {
            write_link(link->url, &link->contents);
        }

        void operator()(ast::type tag, ast::chain const* chain);

        void operator()(ast::type, ast::conditional const* cond)
        {
            if (evaluate(*cond, rc))
                expand(cond->then_branch);
            else if (cond->has_else)
                expand(cond->else_branch);
        }

        void operator()(ast::type tag, void const*)
        {
            if (tag == ast::type::self)
                handle_self();
        }

        void handle_self();
    };

    void content_visitor::write_user(resolved const& r)
    {
        auto const owner = rc.sites.find(r.site);
        if (r.kind == match::generic || !owner)
            return write_link(r.attribute, r.display);
        if (r.display)
            return write_link(owner->profile_url(r.attribute), r.display);
        auto const& s = style();
        if (s.user_link && s.user_link(os, *owner, r.attribute))
            return;
        s.link(os, owner->profile_url(r.attribute), r.attribute);
    }

    void content_visitor::write_url(resolved const& r)
    {
        if (r.display || r.kind == match::generic)
            return write_link(r.attribute, r.display);
        style().link(os, r.attribute, r.attribute);
    }

    void content_visitor::operator()(ast::type tag, ast::block const* block)
    {
        markup::wrap_fn wrap = nullptr;
        switch (tag)
        {
        case ast::type::bold: wrap = style().bold; break;
        case ast::type::italic: wrap = style().italic; break;
        case ast::type::underline: wrap = style().underline; break;
        default: break;
        }
        if (!wrap)
            return expand(block->contents);
        wrap(os, capture(block->contents));
    }

    void content_visitor::operator()(ast::type tag, ast::chain const* chain)
    {
        bool const users = tag == ast::type::user_switch;
        auto const r = resolve(*chain, users, rc.target.name);
        if (!r)
        {
            if (report)
                report(gap{gap_kind::no_binding, rc.target.name, chain});
            return;
        }
        if (users)
            write_user(*r);
        else
            write_url(*r);
    }

    void content_visitor::handle_self()
    {
        auto const r = resolve(self, true, rc.target.name);
        // Falling back to some other configured site would link an arbitrary
        // profile, so only an exact match is written.
        if (!r || r->kind != match::exact)
        {
            if (report)
                report(gap{gap_kind::no_user, rc.target.name, nullptr});
            return;
        }
        write_user(*r);
    }

    void render(output_handler os, description const& desc, render_context const& ctx, gap_handler f)
    {
        auto const& doc = desc.doc();
        content_visitor visitor{doc.ctx, ctx, os, f};
        for (auto const content : doc.contents)
            doc.ctx.visit(visitor, content);
    }
}

namespace tagsmith
{
    std::string to_message(gap const& g)
    {
        if (g.kind == gap_kind::no_user)
            return detail::fmt::format("no username configured for {}; [self] left empty", g.target);
        std::string sites;
        if (g.chain)
        {
            for (auto const& b : g.chain->bindings)
            {
                if (!sites.empty())
                    sites += ", ";
                sites += b.site;
            }
        }
        return detail::fmt::format("[siteurl] has no binding for {} (has: {}); left empty", g.target, sites);
    }
}
