/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <tagsmith/description.hpp>
#include <tagsmith/resolve.hpp>

using namespace tagsmith;

static ast::chain const& first_chain(description const& desc)
{
    return desc.doc().ctx.chains.at(0);
}

TEST_CASE("exact beats innermost")
{
    auto const desc = "[fa=Ipsum]Dolor[/fa]"_desc;
    auto const& chain = first_chain(desc);

    auto const at_fa = resolve(chain, true, "furaffinity");
    REQUIRE(at_fa);
    CHECK(at_fa->kind == match::exact);
    CHECK(at_fa->site == "furaffinity");
    CHECK(at_fa->attribute == "Ipsum");
    CHECK(at_fa->display == &chain.bindings[0].display);

    auto const at_ib = resolve(chain, true, "inkbunny");
    REQUIRE(at_ib);
    CHECK(at_ib->kind == match::innermost);
    CHECK(at_ib->site == "furaffinity");
    CHECK(at_ib->attribute == "Ipsum");
    CHECK(at_ib->display == at_fa->display);
}

TEST_CASE("generic beats innermost, loses to exact")
{
    auto const desc = "[fa=Elit][generic=U]Bad Manners[/generic][/fa]"_desc;
    auto const& chain = first_chain(desc);

    auto const at_fa = resolve(chain, true, "furaffinity");
    REQUIRE(at_fa);
    CHECK(at_fa->kind == match::exact);
    CHECK(at_fa->attribute == "Elit");
    CHECK(at_fa->display == nullptr);

    for (auto const site : {"aryion", "weasyl", "inkbunny", "sofurry", "twitter"})
    {
        auto const r = resolve(chain, true, site);
        REQUIRE(r);
        CHECK(r->kind == match::generic);
        CHECK(r->attribute == "U");
        CHECK(r->display == &chain.bindings[1].display);
    }
}

TEST_CASE("generic takes outer display")
{
    auto const desc = "[generic=https://a.b][eka=Lorem]Ipsum[/eka][/generic]"_desc;
    auto const& chain = first_chain(desc);

    auto const r = resolve(chain, true, "weasyl");
    REQUIRE(r);
    CHECK(r->kind == match::generic);
    CHECK(r->attribute == "https://a.b");
    CHECK(r->display == &chain.bindings[1].display);
}

TEST_CASE("site urls never fall back to innermost")
{
    auto const desc = "[siteurl][sf=A][eka=B]Text[/eka][/sf][/siteurl]"_desc;
    auto const& chain = first_chain(desc);

    CHECK(resolve(chain, false, "sofurry"));
    CHECK(resolve(chain, false, "aryion"));
    CHECK(!resolve(chain, false, "furaffinity"));
    CHECK(!resolve(chain, false, "weasyl"));
    CHECK(resolve(chain, true, "weasyl"));
}

TEST_CASE("innermost owner")
{
    auto const desc = "[fa=A][ib=B][sf=C][/sf][/ib][/fa]"_desc;
    auto const r = resolve(first_chain(desc), true, "weasyl");

    REQUIRE(r);
    CHECK(r->kind == match::innermost);
    CHECK(r->site == "sofurry");
    CHECK(r->attribute == "C");
    CHECK(r->display == nullptr);
}

TEST_CASE("evaluate")
{
    flag_set const defines{"nsfw"};

    auto const cond = [](description const& desc) -> ast::conditional const&
    {
        return desc.doc().ctx.conditionals.at(0);
    };

    auto const eq = "[if=site==fa]X[/if]"_desc;
    CHECK(evaluate(cond(eq), "furaffinity", defines));
    CHECK(!evaluate(cond(eq), "weasyl", defines));

    auto const ne = "[if=site!=fa]X[/if]"_desc;
    CHECK(!evaluate(cond(ne), "furaffinity", defines));
    CHECK(evaluate(cond(ne), "weasyl", defines));

    auto const in = "[if=site in eka,fa]X[/if]"_desc;
    CHECK(evaluate(cond(in), "aryion", defines));
    CHECK(evaluate(cond(in), "furaffinity", defines));
    CHECK(!evaluate(cond(in), "inkbunny", defines));

    auto const def = "[if=define==nsfw]X[/if]"_desc;
    CHECK(evaluate(cond(def), "weasyl", defines));
    CHECK(!evaluate(cond(def), "weasyl", flag_set{}));

    auto const def_in = "[if=define in a,b]X[/if]"_desc;
    CHECK(!evaluate(cond(def_in), "weasyl", defines));
    CHECK(evaluate(cond(def_in), "weasyl", flag_set{"b"}));
}

TEST_CASE("self chain")
{
    user_config const users{{"furaffinity", "Me"}, {"weasyl", "Also Me"}};
    auto const chain = self_chain(users);

    REQUIRE(chain.bindings.size() == 2);
    auto const r = resolve(chain, true, "weasyl");
    REQUIRE(r);
    CHECK(r->kind == match::exact);
    CHECK(r->attribute == "Also Me");
    CHECK(resolve(chain, true, "inkbunny")->kind == match::innermost);
}
