/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/site.hpp>
#include <algorithm>
#include <stdexcept>
#include <cctype>

namespace tagsmith::detail { namespace
{
    constexpr char lower(char c) noexcept
    {
        return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
    }

    std::string lowered(std::string_view s)
    {
        std::string ret(s);
        for (auto& c : ret)
            c = lower(c);
        return ret;
    }

    std::string without(std::string_view s, char drop)
    {
        std::string ret;
        ret.reserve(s.size());
        for (char c : s)
        {
            if (c != drop)
                ret.push_back(c);
        }
        return ret;
    }

    std::string replaced(std::string_view s, char from, char to)
    {
        std::string ret(s);
        std::replace(ret.begin(), ret.end(), from, to);
        return ret;
    }

    std::string_view twitter_handle(std::string_view user) noexcept
    {
        user = trim(user);
        auto const at = user.rfind('@');
        return at == user.npos ? user : user.substr(at + 1);
    }

    struct mastodon_handle
    {
        std::string_view user;
        std::string_view instance;

        explicit operator bool() const noexcept
        {
            return !user.empty() && !instance.empty();
        }
    };

    // Accepts `user@instance` with an optional leading '@'.
    mastodon_handle split_mastodon(std::string_view handle) noexcept
    {
        handle = trim(handle);
        auto const at = handle.rfind('@');
        if (at == handle.npos)
            return {};
        auto user = handle.substr(0, at);
        auto const prev = user.rfind('@');
        if (prev != user.npos)
            user = user.substr(prev + 1);
        return {user, handle.substr(at + 1)};
    }

    // Profile URLs.

    std::string aryion_profile(std::string_view user)
    {
        return fmt::format("https://aryion.com/g4/user/{}", user);
    }

    std::string furaffinity_profile(std::string_view user)
    {
        return fmt::format("https://furaffinity.net/user/{}", without(user, '_'));
    }

    std::string weasyl_profile(std::string_view user)
    {
        return fmt::format("https://www.weasyl.com/~{}", lowered(without(user, ' ')));
    }

    std::string inkbunny_profile(std::string_view user)
    {
        return fmt::format("https://inkbunny.net/{}", user);
    }

    std::string sofurry_profile(std::string_view user)
    {
        return fmt::format("https://{}.sofurry.com", lowered(replaced(user, ' ', '-')));
    }

    std::string twitter_profile(std::string_view user)
    {
        return fmt::format("https://twitter.com/{}", twitter_handle(user));
    }

    std::string mastodon_profile(std::string_view user)
    {
        auto const handle = split_mastodon(user);
        return fmt::format("https://{}/@{}", handle.instance, handle.user);
    }

    bool valid_mastodon(std::string_view user)
    {
        return !!split_mastodon(user);
    }

    // Markup families.

    void bbcode_bold(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "[b]{}[/b]", inner);
    }

    void bbcode_italic(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "[i]{}[/i]", inner);
    }

    void bbcode_underline(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "[u]{}[/u]", inner);
    }

    void bbcode_link(output_handler os, std::string_view url, std::string_view text)
    {
        print(os, "[url={}]{}[/url]", url, text);
    }

    void markdown_bold(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "**{}**", inner);
    }

    void markdown_italic(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "*{}*", inner);
    }

    void markdown_underline(output_handler os, std::string_view inner)
    {
        if (!is_blank(inner))
            print(os, "<u>{}</u>", inner);
    }

    void markdown_link(output_handler os, std::string_view url, std::string_view text)
    {
        print(os, "[{}]({})", text, url);
    }

    void plaintext_link(output_handler os, std::string_view url, std::string_view text)
    {
        if (is_blank(text) || trim(text) == url)
            write(os, url);
        else
            print(os, "{}: {}", trim(text), url);
    }

    // User references.

    bool icon_user(output_handler os, site const& owner, std::string_view user, std::string_view self)
    {
        if (owner.name != self)
            return false;
        print(os, ":icon{}:", user);
        return true;
    }

    bool aryion_user(output_handler os, site const& owner, std::string_view user)
    {
        return icon_user(os, owner, user, "aryion");
    }

    bool furaffinity_user(output_handler os, site const& owner, std::string_view user)
    {
        return icon_user(os, owner, user, "furaffinity");
    }

    bool weasyl_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name == "weasyl")
            print(os, "<!~{}>", without(user, ' '));
        else if (owner.name == "furaffinity")
            print(os, "<fa:{}>", user);
        else if (owner.name == "inkbunny")
            print(os, "<ib:{}>", user);
        else if (owner.name == "sofurry")
            print(os, "<sf:{}>", user);
        else
            return false;
        return true;
    }

    bool inkbunny_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name == "inkbunny")
            print(os, "[iconname]{}[/iconname]", user);
        else if (owner.name == "furaffinity")
            print(os, "[fa]{}[/fa]", user);
        else if (owner.name == "sofurry")
            print(os, "[sf]{}[/sf]", user);
        else if (owner.name == "weasyl")
            print(os, "[weasyl]{}[/weasyl]", lowered(without(user, ' ')));
        else
            return false;
        return true;
    }

    bool sofurry_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name == "sofurry")
            print(os, ":icon{}:", user);
        else if (owner.name == "furaffinity")
            print(os, "fa!{}", user);
        else if (owner.name == "inkbunny")
            print(os, "ib!{}", user);
        else
            return false;
        return true;
    }

    bool plaintext_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name == "twitter")
            print(os, "@{} on {}", twitter_handle(user), owner.title);
        else if (owner.name == "mastodon")
        {
            auto const handle = split_mastodon(user);
            print(os, "@{} on {}", handle.user, handle.instance);
        }
        else
            print(os, "{} on {}", user, owner.title);
        return true;
    }

    bool twitter_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name != "twitter")
            return plaintext_user(os, owner, user);
        print(os, "@{}", twitter_handle(user));
        return true;
    }

    bool mastodon_user(output_handler os, site const& owner, std::string_view user)
    {
        if (owner.name != "mastodon")
            return plaintext_user(os, owner, user);
        auto const handle = split_mastodon(user);
        print(os, "@{}@{}", handle.user, handle.instance);
        return true;
    }

    markup const aryion_markup{bbcode_bold, bbcode_italic, bbcode_underline, bbcode_link, aryion_user};
    markup const furaffinity_markup{bbcode_bold, bbcode_italic, bbcode_underline, bbcode_link, furaffinity_user};
    markup const weasyl_markup{markdown_bold, markdown_italic, markdown_underline, markdown_link, weasyl_user};
    markup const inkbunny_markup{bbcode_bold, bbcode_italic, bbcode_underline, bbcode_link, inkbunny_user};
    markup const sofurry_markup{bbcode_bold, bbcode_italic, bbcode_underline, bbcode_link, sofurry_user};
    markup const twitter_markup{nullptr, nullptr, nullptr, plaintext_link, twitter_user};
    markup const mastodon_markup{nullptr, nullptr, nullptr, plaintext_link, mastodon_user};
}}

namespace tagsmith
{
    namespace markups
    {
        markup const bbcode{detail::bbcode_bold, detail::bbcode_italic, detail::bbcode_underline, detail::bbcode_link, nullptr};
        markup const markdown{detail::markdown_bold, detail::markdown_italic, detail::markdown_underline, detail::markdown_link, nullptr};
        markup const plaintext{nullptr, nullptr, nullptr, detail::plaintext_link, detail::plaintext_user};
    }

    bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i != a.size(); ++i)
        {
            if (detail::lower(a[i]) != detail::lower(b[i]))
                return false;
        }
        return true;
    }

    std::string_view trim(std::string_view s) noexcept
    {
        auto const is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!s.empty() && is_space(s.front()))
            s.remove_prefix(1);
        while (!s.empty() && is_space(s.back()))
            s.remove_suffix(1);
        return s;
    }

    std::string normalize_lines(std::string_view text)
    {
        constexpr std::string_view bom("\xEF\xBB\xBF");
        if (text.starts_with(bom))
            text.remove_prefix(bom.size());

        std::string ret;
        ret.reserve(text.size());
        for (;;)
        {
            auto const n = text.find('\n');
            ret += trim(text.substr(0, n));
            if (n == text.npos)
                return ret;
            ret += '\n';
            text.remove_prefix(n + 1);
        }
    }

    site const* site_registry::find(std::string_view alias) const noexcept
    {
        for (auto const& s : _sites)
        {
            for (auto const a : s.aliases)
            {
                if (iequals(a, alias))
                    return &s;
            }
        }
        return nullptr;
    }

    site const& site_registry::get(std::string_view alias) const
    {
        if (auto const p = find(alias))
            return *p;
        throw std::out_of_range("unknown site: " + std::string(alias));
    }

    site_registry const& site_registry::builtin()
    {
        using namespace detail;
        static site_registry const registry
        {{
            {"aryion", "Eka's Portal", {"aryion", "eka", "eka_portal"}, "desc_aryion.txt", aryion_profile, nullptr, &aryion_markup, story_format::rtf},
            {"furaffinity", "Fur Affinity", {"furaffinity", "fa"}, "desc_furaffinity.txt", furaffinity_profile, nullptr, &furaffinity_markup, story_format::txt},
            {"weasyl", "Weasyl", {"weasyl"}, "desc_weasyl.md", weasyl_profile, nullptr, &weasyl_markup, story_format::md},
            {"inkbunny", "Inkbunny", {"inkbunny", "ib"}, "desc_inkbunny.txt", inkbunny_profile, nullptr, &inkbunny_markup, story_format::txt},
            {"sofurry", "SoFurry", {"sofurry", "sf"}, "desc_sofurry.txt", sofurry_profile, nullptr, &sofurry_markup, story_format::txt},
            {"twitter", "Twitter", {"twitter"}, "desc_twitter.txt", twitter_profile, nullptr, &twitter_markup, story_format::none},
            {"mastodon", "Mastodon", {"mastodon"}, "desc_mastodon.txt", mastodon_profile, valid_mastodon, &mastodon_markup, story_format::none}
        }};
        return registry;
    }
}
