/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <tagsmith/description.hpp>
#include "fixture.hpp"

using namespace tagsmith;
using test::parse_code;

TEST_CASE("aliasing")
{
    CHECK("[eka=Lorem][/eka]"_desc == "[eka]Lorem[/eka]"_desc);
    CHECK("[fa]Ipsum[/fa]"_desc == "[furaffinity]Ipsum[/furaffinity]"_desc);
    CHECK("[FA]Ipsum[/FA]"_desc == "[fa]Ipsum[/fa]"_desc);
    CHECK("[FA=A]x[/fa]"_desc == "[fa=A]x[/fa]"_desc);
    CHECK("[siteurl][Sf=A][generic=U]x[/generic][/sF][/siteurl]"_desc == "[siteurl][sf=A][generic=U]x[/generic][/sf][/siteurl]"_desc);
    CHECK(test::parse_code("[B]x[/b]") == error_unknown_tag);
    CHECK(test::parse_code("[b]x[/B]") == error_mismatched);
    CHECK("[user][fa=A]x[/fa][/user]"_desc == "[fa=A]x[/fa]"_desc);
}

TEST_CASE("chain")
{
    auto const desc = "[fa=Elit][generic=U]Bad Manners[/generic][/fa]"_desc;
    auto const& doc = desc.doc();

    REQUIRE(doc.contents.size() == 1);
    CHECK(doc.contents[0].kind == ast::type::user_switch);
    REQUIRE(doc.ctx.chains.size() == 1);

    auto const& chain = doc.ctx.chains[0];
    REQUIRE(chain.bindings.size() == 2);
    CHECK(chain.bindings[0].site == "furaffinity");
    CHECK(chain.bindings[0].attribute == "Elit");
    CHECK(chain.bindings[0].display.empty());
    CHECK(chain.bindings[1].is_generic());
    CHECK(chain.bindings[1].attribute == "U");
    REQUIRE(chain.bindings[1].display.size() == 1);
    CHECK(doc.ctx.texts[chain.bindings[1].display[0].index] == "Bad Manners");
    CHECK(chain.display_override() == nullptr);
}

TEST_CASE("leaf attribute from text")
{
    auto const desc = "[ib] Some User [/ib]"_desc;
    auto const& chain = desc.doc().ctx.chains.at(0);

    REQUIRE(chain.bindings.size() == 1);
    CHECK(chain.bindings[0].site == "inkbunny");
    CHECK(chain.bindings[0].attribute == "Some User");
    CHECK(desc.doc().ctx.texts.empty());
}

TEST_CASE("display trimming")
{
    SECTION("surrounding space")
    {
        auto const desc = "[fa=A] Dolor [/fa]"_desc;
        auto const& doc = desc.doc();
        auto const& chain = doc.ctx.chains.at(0);

        REQUIRE(chain.bindings[0].display.size() == 1);
        CHECK(doc.ctx.texts[chain.bindings[0].display[0].index] == "Dolor");
    }

    SECTION("inner formatting kept")
    {
        auto const desc = "[fa=A]\n[b]Dolor[/b] sit\n[/fa]"_desc;
        auto const& doc = desc.doc();
        auto const& display = doc.ctx.chains.at(0).bindings[0].display;

        REQUIRE(display.size() == 2);
        CHECK(display[0].kind == ast::type::bold);
        CHECK(doc.ctx.texts[display[1].index] == " sit");
    }

    SECTION("blank display dropped")
    {
        for (auto const src : {"[fa=A] [/fa]", "[fa=A]\n[/fa]", "[fa=A][b] [/b][/fa]"})
        {
            description const desc(src);
            auto const& chain = desc.doc().ctx.chains.at(0);

            CHECK(chain.bindings[0].display.empty());
            CHECK(chain.display_override() == nullptr);
            CHECK(desc.doc().ctx.texts.empty());
        }
    }

    SECTION("blank generic display dropped")
    {
        auto const desc = "[fa=A][generic=U]  [/generic][/fa]"_desc;
        auto const& chain = desc.doc().ctx.chains.at(0);

        REQUIRE(chain.bindings.size() == 2);
        CHECK(chain.bindings[1].display.empty());
    }
}

TEST_CASE("siteurl")
{
    auto const desc = "[siteurl][sf=A][eka=B]Text[/eka][/sf][/siteurl]"_desc;
    auto const& doc = desc.doc();

    REQUIRE(doc.contents.size() == 1);
    CHECK(doc.contents[0].kind == ast::type::siteurl_switch);
    auto const& chain = doc.ctx.chains.at(0);
    REQUIRE(chain.bindings.size() == 2);
    CHECK(chain.bindings[0].site == "sofurry");
    CHECK(chain.bindings[1].site == "aryion");
    CHECK(chain.display_override() == &chain.bindings[1].display);
}

TEST_CASE("conditional")
{
    SECTION("else")
    {
        auto const desc = "[if=site==fa]X[/if][else]Y[/else]"_desc;
        auto const& cond = desc.doc().ctx.conditionals.at(0);

        CHECK(cond.lhs == ast::param::site);
        CHECK(cond.op == ast::relation::eq);
        CHECK(cond.operands == std::vector<std::string>{"furaffinity"});
        CHECK(cond.has_else);
        CHECK(desc.doc().contents.size() == 1);
    }

    SECTION("in")
    {
        auto const desc = "[if=site in eka, fa]X[/if]"_desc;
        auto const& cond = desc.doc().ctx.conditionals.at(0);

        CHECK(cond.op == ast::relation::in);
        CHECK(cond.operands == std::vector<std::string>{"aryion", "furaffinity"});
        CHECK(!cond.has_else);
    }

    SECTION("define")
    {
        auto const desc = "[if=define != nsfw-ok]X[/if]"_desc;
        auto const& cond = desc.doc().ctx.conditionals.at(0);

        CHECK(cond.lhs == ast::param::define);
        CHECK(cond.op == ast::relation::ne);
        CHECK(cond.operands == std::vector<std::string>{"nsfw-ok"});
    }

    SECTION("orphan else")
    {
        CHECK(parse_code("[if=site==fa]X[/if] [else]Y[/else]") == error_orphan_else);
        CHECK(parse_code("[else]Y[/else]") == error_orphan_else);
    }
}

TEST_CASE("literal brackets")
{
    auto const desc = "[1] costs [ $5 ]"_desc;

    REQUIRE(desc.doc().contents.size() == 1);
    CHECK(desc.doc().ctx.texts[0] == "[1] costs [ $5 ]");
}

TEST_CASE("url")
{
    auto const desc = "[url]https://example.com[/url] [url=https://a.b]A[/url]"_desc;
    auto const& links = desc.doc().ctx.links;

    REQUIRE(links.size() == 2);
    CHECK(links[0].url == "https://example.com");
    CHECK(links[1].url == "https://a.b");
    CHECK(parse_code("[url][/url]") == error_attribute);
}

TEST_CASE("parse errors")
{
    CHECK(parse_code("[b]x") == error_unclosed);
    CHECK(parse_code("[b]x[/i]") == error_mismatched);
    CHECK(parse_code("x[/b]") == error_mismatched);
    CHECK(parse_code("[foo]x[/foo]") == error_unknown_tag);
    CHECK(parse_code("[b=1]x[/b]") == error_attribute);
    CHECK(parse_code("[b x") == error_tag);
    CHECK(parse_code("[self]x[/self]") == error_self_content);
    CHECK(parse_code("[fa=A][furaffinity=B]x[/furaffinity][/fa]") == error_duplicate_site);
    CHECK(parse_code("[generic]x[/generic]") == error_attribute);
    CHECK(parse_code("[fa][eka=B]x[/eka][/fa]") == error_attribute);
    CHECK(parse_code("[fa][/fa]") == error_attribute);
    CHECK(parse_code("[fa=A][eka=B]x[/eka] tail[/fa]") == error_switch_content);
    CHECK(parse_code("[fa=A]see [url=x]y[/url][/fa]") == error_switch_content);
    CHECK(parse_code("[user]text[/user]") == error_switch_content);
    CHECK(parse_code("[mastodon]someone[/mastodon]") == error_username);
    CHECK(parse_code("[if=color==red]x[/if]") == error_param);
    CHECK(parse_code("[if=site==nowhere]x[/if]") == error_site);
    CHECK(parse_code("[if=site==fa,ib]x[/if]") == error_condition);
    CHECK(parse_code("[if=]x[/if]") == error_condition);
}

TEST_CASE("error report")
{
    try
    {
        description const desc("abc[b]x");
        FAIL("expected parse_error");
    }
    catch (parse_error const& e)
    {
        CHECK(e.code() == error_unclosed);
        CHECK(e.position() == 3);
        CHECK(e.tag() == "b");
        CHECK(std::string(e.what()) == "unclosed tag: b");
    }
}

TEST_CASE("copy")
{
    std::string src("[b]Hello[/b] world");
    description const copied(src, true);
    src.assign(src.size(), '-');

    auto const& texts = copied.doc().ctx.texts;
    REQUIRE(texts.size() == 2);
    CHECK(texts[0] == "Hello");
    CHECK(texts[1] == " world");

    description const again(copied);
    CHECK(again == copied);
}
