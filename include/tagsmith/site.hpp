/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_SITE_HPP_INCLUDED
#define TAGSMITH_SITE_HPP_INCLUDED

#include <tagsmith/detail/fn.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace tagsmith
{
    struct site;

    // Formatting adapter of one destination. A null wrapper means the site
    // has no markup for that kind and children are written unwrapped.
    struct markup
    {
        using wrap_fn = void(*)(output_handler os, std::string_view inner);
        using link_fn = void(*)(output_handler os, std::string_view url, std::string_view text);
        // Returns false when the destination has no native reference for
        // users of `owner`, in which case a profile link is written instead.
        using user_fn = bool(*)(output_handler os, site const& owner, std::string_view user);

        wrap_fn bold;
        wrap_fn italic;
        wrap_fn underline;
        link_fn link;
        user_fn user_link;
    };

    // Upload format of a story for a site.
    enum class story_format
    {
        none,
        txt,
        md,
        rtf
    };

    struct site
    {
        using profile_fn = std::string(*)(std::string_view user);
        using check_fn = bool(*)(std::string_view user);

        std::string_view name;
        std::string_view title;
        std::vector<std::string_view> aliases;
        std::string_view output;
        profile_fn profile_url;
        check_fn valid_user; // May be null.
        markup const* style;
        story_format story;

        bool accepts(std::string_view user) const
        {
            return !valid_user || valid_user(user);
        }
    };

    class site_registry
    {
        std::vector<site> _sites;

    public:
        explicit site_registry(std::vector<site> sites) : _sites(std::move(sites)) {}

        // Looks `alias` up case-insensitively; the generic name is not a site.
        TAGSMITH_API site const* find(std::string_view alias) const noexcept;

        site const& get(std::string_view alias) const;

        std::vector<site>::const_iterator begin() const noexcept { return _sites.begin(); }
        std::vector<site>::const_iterator end() const noexcept { return _sites.end(); }
        std::size_t size() const noexcept { return _sites.size(); }

        TAGSMITH_API static site_registry const& builtin();
    };

    namespace markups
    {
        TAGSMITH_API extern markup const bbcode;
        TAGSMITH_API extern markup const markdown;
        TAGSMITH_API extern markup const plaintext;
    }

    TAGSMITH_API bool iequals(std::string_view a, std::string_view b) noexcept;

    TAGSMITH_API std::string_view trim(std::string_view s) noexcept;

    inline bool is_blank(std::string_view s) noexcept
    {
        return trim(s).empty();
    }

    // Drops a UTF-8 BOM and trims every line; lines are joined with LF.
    TAGSMITH_API std::string normalize_lines(std::string_view text);
}

#endif
