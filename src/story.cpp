/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/story.hpp>
#include <regex>

namespace tagsmith::detail { namespace
{
    void escape_markdown(std::string& out, std::string_view line)
    {
        for (std::size_t i = 0; i != line.size(); ++i)
        {
            char const c = line[i];
            if (c == '*')
                out += "\\*";
            else if (c == '=' && i + 1 != line.size() && line[i + 1] == '=')
                out += "= ";
            else
                out += c;
        }
    }

    std::string const& lookup(style_table const& styles, std::string_view name)
    {
        auto it = styles.find(name);
        if (it == styles.end())
            throw story_error(fmt::format("RTF style \"{}\" not found", name));
        return it->second;
    }
}}

namespace tagsmith
{
    story_text normalize_story(std::string_view source)
    {
        auto const lines = normalize_lines(source);
        std::string_view text(lines);

        story_text ret;
        bool gap = false;
        while (!text.empty())
        {
            auto const n = text.find('\n');
            auto const line = text.substr(0, n);
            text.remove_prefix(n == text.npos ? text.size() : n + 1);
            if (line.empty())
            {
                gap = !ret.empty;
                continue;
            }
            if (!ret.empty)
            {
                char const* sep = gap ? "\r\n\r\n" : "\r\n";
                ret.txt += sep;
                ret.md += sep;
                ret.plain += '\n';
                gap = false;
            }
            ret.txt += line;
            detail::escape_markdown(ret.md, line);
            ret.plain += line;
            ret.empty = false;
        }
        ret.txt += "\r\n";
        ret.md += "\r\n";
        return ret;
    }

    style_table rtf_styles(std::string_view rtf)
    {
        static std::regex const re
        (
            R"(\\s(\d+)(?:\\sbasedon\d+)?\\snext\d+((?:\\[a-z0-9]+ ?)+)(?: ([A-Z][a-zA-Z ]*));)"
        );
        style_table ret;
        std::cregex_iterator it(rtf.data(), rtf.data() + rtf.size(), re), end;
        for (; it != end; ++it)
        {
            auto const& m = *it;
            auto words = "\\s" + m[1].str() + m[2].str();
            ret.emplace(m[1].str(), words);
            ret.emplace(m[3].str(), std::move(words));
        }
        if (ret.empty())
            throw story_error("no valid RTF styles found");
        return ret;
    }

    std::string swap_style(std::string_view rtf, style_pair const& styles)
    {
        auto const table = rtf_styles(rtf);
        auto const& from = detail::lookup(table, styles.from);
        auto const& to = detail::lookup(table, styles.to);

        std::string ret;
        ret.reserve(rtf.size());
        for (;;)
        {
            auto const n = rtf.find(from);
            if (n == rtf.npos)
                break;
            ret += rtf.substr(0, n);
            ret += to;
            rtf.remove_prefix(n + from.size());
        }
        ret += rtf;
        return ret;
    }

    std::vector<story_output> build_story
    (
        story_text const& story, user_config const& users, document_converter& conv,
        site_registry const& sites, style_pair const& styles
    )
    {
        bool wanted[4] = {};
        for (auto const& s : sites)
        {
            if (users.user(s.name))
                wanted[unsigned(s.story)] = true;
        }
        std::vector<story_output> ret;
        if (wanted[unsigned(story_format::txt)])
            ret.push_back({story_format::txt, story.txt});
        if (wanted[unsigned(story_format::md)])
            ret.push_back({story_format::md, story.md});
        if (wanted[unsigned(story_format::rtf)])
            ret.push_back({story_format::rtf, conv.convert(story.plain, styles)});
        if (ret.empty())
            throw story_error("no configured website accepts stories");
        return ret;
    }
}
