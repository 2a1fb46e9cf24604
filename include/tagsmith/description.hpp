/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2014-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_DESCRIPTION_HPP_INCLUDED
#define TAGSMITH_DESCRIPTION_HPP_INCLUDED

#include <tagsmith/ast.hpp>
#include <tagsmith/site.hpp>
#include <stdexcept>
#include <cstddef>
#include <utility>
#include <memory>

namespace tagsmith
{
    enum error_type
    {
        error_tag,
        error_unknown_tag,
        error_unclosed,
        error_mismatched,
        error_self_content,
        error_switch_content,
        error_duplicate_site,
        error_attribute,
        error_username,
        error_orphan_else,
        error_condition,
        error_param,
        error_site
    };

    class parse_error : public std::runtime_error
    {
        error_type _err;
        std::ptrdiff_t _pos;
        std::string _tag;

    public:
        TAGSMITH_API parse_error(error_type err, std::ptrdiff_t position, std::string tag = {});

        error_type code() const noexcept { return _err; }
        std::ptrdiff_t position() const noexcept { return _pos; }
        std::string const& tag() const noexcept { return _tag; }
    };

    // A parsed description. Text nodes view the source unless it is copied.
    struct description
    {
        description() = default;

        explicit description(std::string_view source, site_registry const& sites = site_registry::builtin())
        {
            init(source.data(), source.data() + source.size(), sites);
        }

        description(std::string_view source, bool copytext, site_registry const& sites = site_registry::builtin())
        {
            init(source.data(), source.data() + source.size(), sites);
            if (copytext)
                copy_text(text_size());
        }

        description(description&& other) = default;

        description(description const& other) : _doc(other._doc)
        {
            if (other._text)
                copy_text(text_size());
        }

        description& operator=(description&& other) = default;

        description& operator=(description const& other)
        {
            return operator=(description(other));
        }

        ast::document const& doc() const noexcept
        {
            return _doc;
        }

        bool empty() const noexcept
        {
            return _doc.contents.empty();
        }

        friend bool operator==(description const& a, description const& b)
        {
            return a._doc == b._doc;
        }

    private:
        TAGSMITH_API void init(char const* begin, char const* end, site_registry const& sites);
        TAGSMITH_API std::size_t text_size() const noexcept;
        TAGSMITH_API void copy_text(std::size_t n);

        ast::document _doc;
        std::unique_ptr<char[]> _text;
    };

    inline namespace literals
    {
        inline description operator""_desc(char const* str, std::size_t n)
        {
            return description(std::string_view(str, n));
        }
    }
}

#endif
