/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <tagsmith/site.hpp>

using namespace tagsmith;

TEST_CASE("lookup")
{
    auto const& sites = site_registry::builtin();

    REQUIRE(sites.size() == 7);
    CHECK(sites.find("eka") == sites.find("aryion"));
    CHECK(sites.find("Eka_Portal") == sites.find("aryion"));
    CHECK(sites.find("FA")->name == "furaffinity");
    CHECK(sites.find("ib")->name == "inkbunny");
    CHECK(sites.find("SF")->name == "sofurry");
    CHECK(sites.find("generic") == nullptr);
    CHECK(sites.find("deviantart") == nullptr);
    CHECK_THROWS_AS(sites.get("deviantart"), std::out_of_range);

    std::vector<std::string_view> names;
    for (auto const& s : sites)
        names.push_back(s.name);
    CHECK(names == std::vector<std::string_view>
    {
        "aryion", "furaffinity", "weasyl", "inkbunny", "sofurry", "twitter", "mastodon"
    });
}

TEST_CASE("output files")
{
    auto const& sites = site_registry::builtin();

    CHECK(sites.get("aryion").output == "desc_aryion.txt");
    CHECK(sites.get("weasyl").output == "desc_weasyl.md");
    CHECK(sites.get("mastodon").output == "desc_mastodon.txt");
    CHECK(sites.get("aryion").story == story_format::rtf);
    CHECK(sites.get("weasyl").story == story_format::md);
    CHECK(sites.get("ib").story == story_format::txt);
    CHECK(sites.get("twitter").story == story_format::none);
}

TEST_CASE("profile urls")
{
    auto const& sites = site_registry::builtin();
    auto const profile = [&](std::string_view site, std::string_view user)
    {
        return sites.get(site).profile_url(user);
    };

    CHECK(profile("eka", "Lorem") == "https://aryion.com/g4/user/Lorem");
    CHECK(profile("fa", "Some_User") == "https://furaffinity.net/user/SomeUser");
    CHECK(profile("weasyl", "Some User") == "https://www.weasyl.com/~someuser");
    CHECK(profile("ib", "Bun") == "https://inkbunny.net/Bun");
    CHECK(profile("sf", "Fox Tail") == "https://fox-tail.sofurry.com");
    CHECK(profile("twitter", "@bird") == "https://twitter.com/bird");
    CHECK(profile("mastodon", "@me@mastodon.social") == "https://mastodon.social/@me");
    CHECK(profile("mastodon", "me@mastodon.social") == "https://mastodon.social/@me");
}

TEST_CASE("usernames")
{
    auto const& sites = site_registry::builtin();

    CHECK(sites.get("fa").accepts("anything"));
    CHECK(sites.get("mastodon").accepts("@me@mastodon.social"));
    CHECK(sites.get("mastodon").accepts("me@mastodon.social"));
    CHECK(!sites.get("mastodon").accepts("me"));
    CHECK(!sites.get("mastodon").accepts("me@"));
    CHECK(!sites.get("mastodon").accepts("@mastodon.social"));
}

TEST_CASE("markups")
{
    std::string out;
    auto const sink = [&out](char const* data, std::size_t bytes)
    {
        out.append(data, bytes);
    };

    markups::bbcode.bold(sink, "x");
    markups::markdown.italic(sink, "y");
    markups::markdown.link(sink, "https://a.b", "ab");
    markups::plaintext.link(sink, "https://a.b", "https://a.b");
    markups::plaintext.link(sink, "https://a.b", " ");
    CHECK(out == "[b]x[/b]*y*[ab](https://a.b)https://a.bhttps://a.b");
    CHECK(markups::plaintext.bold == nullptr);
}

TEST_CASE("text helpers")
{
    CHECK(iequals("FurAffinity", "furaffinity"));
    CHECK(!iequals("fa", "fb"));
    CHECK(trim("  a b \r\n") == "a b");
    CHECK(is_blank(" \t\n"));
    CHECK(!is_blank(" x "));
}
