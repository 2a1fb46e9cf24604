/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <tagsmith/config.hpp>

using namespace tagsmith;

static std::vector<std::string> config_errors(std::string_view json)
{
    try
    {
        parse_config(json);
    }
    catch (config_error const& e)
    {
        return e.errors();
    }
    return {};
}

TEST_CASE("usernames")
{
    std::vector<std::string> warnings;
    auto const warn = [&warnings](std::string const& msg)
    {
        warnings.push_back(msg);
    };

    auto const users = parse_config
    (
        R"({"FA": "Foo", "eka": " Bar ", "deviantart": "Baz", "mastodon": "@me@mastodon.social"})",
        site_registry::builtin(), warn
    );

    CHECK(users == user_config{{"aryion", "Bar"}, {"furaffinity", "Foo"}, {"mastodon", "@me@mastodon.social"}});
    REQUIRE(users.user("furaffinity"));
    CHECK(*users.user("furaffinity") == "Foo");
    CHECK(users.user("weasyl") == nullptr);
    CHECK(warnings == std::vector<std::string>{"ignoring unknown configuration key \"deviantart\""});
}

TEST_CASE("invalid configuration")
{
    CHECK(config_errors(R"({"fa": 3})") == std::vector<std::string>{"website \"fa\" has invalid username 3"});
    CHECK(config_errors(R"({"fa": "  "})") == std::vector<std::string>{"website \"fa\" has empty username"});
    CHECK(config_errors(R"({"mastodon": "me"})") == std::vector<std::string>{"website \"mastodon\" has invalid username \"me\""});
    CHECK(config_errors(R"({"deviantart": "x"})") == std::vector<std::string>{"no valid websites defined"});
    CHECK(config_errors("{}") == std::vector<std::string>{"no valid websites defined"});
    CHECK(config_errors("[]") == std::vector<std::string>{"configuration must be a JSON object"});
    CHECK(config_errors("{").size() == 1);

    auto const dup = config_errors(R"({"fa": "a", "furaffinity": "b"})");
    REQUIRE(dup.size() == 1);
    CHECK(dup[0].find("duplicate entry for website \"furaffinity\"") == 0);

    auto const many = config_errors(R"({"fa": 1, "ib": ""})");
    CHECK(many.size() == 2);
}

TEST_CASE("error message")
{
    config_error const e({"a", "b"});

    CHECK(std::string(e.what()) == "invalid configuration: a; b");
    CHECK(e.errors().size() == 2);
}

TEST_CASE("flags")
{
    std::vector<std::string> warnings;
    auto const warn = [&warnings](std::string const& msg)
    {
        warnings.push_back(msg);
    };

    auto const flags = make_flags({"nsfw", "draft_1", "nsfw", "a-b"}, warn);
    CHECK(flags == flag_set{"a-b", "draft_1", "nsfw"});
    CHECK(warnings.size() == 1);

    CHECK(is_flag("Ok-_9"));
    CHECK(!is_flag(""));
    CHECK(!is_flag("a b"));
    CHECK(!is_flag("a=b"));
    CHECK_THROWS_AS(make_flags({"fine", "not fine"}), config_error);
}

static std::vector<std::string> logged;

static void log_to_list(std::string const& msg)
{
    logged.push_back(msg);
}

TEST_CASE("free function handler")
{
    logged.clear();
    make_flags({"nsfw", "nsfw"}, log_to_list);
    parse_config(R"({"fa": "Me", "deviantart": "Me"})", site_registry::builtin(), log_to_list);

    REQUIRE(logged.size() == 2);
    CHECK(logged[0] == "option \"nsfw\" is defined more than once");
    CHECK(logged[1] == "ignoring unknown configuration key \"deviantart\"");
}
