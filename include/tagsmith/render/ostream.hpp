/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2016-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_RENDER_OSTREAM_HPP_INCLUDED
#define TAGSMITH_RENDER_OSTREAM_HPP_INCLUDED

#include <iostream>
#include <tagsmith/render.hpp>

namespace tagsmith { namespace detail
{
    template<class CharT, class Traits>
    struct ostream_sink
    {
        std::basic_ostream<CharT, Traits>& out;

        void operator()(char const* data, std::size_t bytes) const
        {
            out.write(data, bytes);
        }
    };
}}

namespace tagsmith
{
    template<class CharT, class Traits>
    inline void render_ostream
    (
        std::basic_ostream<CharT, Traits>& out, description const& desc,
        render_context const& ctx, gap_handler f = nullptr
    )
    {
        render(detail::ostream_sink<CharT, Traits>{out}, desc, ctx, f);
    }
}

#endif
