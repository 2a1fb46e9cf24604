/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_RENDER_STRING_HPP_INCLUDED
#define TAGSMITH_RENDER_STRING_HPP_INCLUDED

#include <string>
#include <tagsmith/render.hpp>

namespace tagsmith::detail
{
    template<class String>
    struct string_sink
    {
        String& out;

        void operator()(char const* data, std::size_t bytes) const
        {
            out.insert(out.end(), data, data + bytes);
        }
    };
}

namespace tagsmith
{
    template<class String>
    inline void render_string
    (
        String& out, description const& desc,
        render_context const& ctx, gap_handler f = nullptr
    )
    {
        render(detail::string_sink<String>{out}, desc, ctx, f);
    }

    inline std::string to_string(description const& desc, render_context const& ctx, gap_handler f = nullptr)
    {
        std::string ret;
        render_string(ret, desc, ctx, f);
        return ret;
    }
}

#endif
