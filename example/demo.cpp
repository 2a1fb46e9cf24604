#include <iostream>
#include <tagsmith/debug.hpp>
#include <tagsmith/generate.hpp>
#include <tagsmith/render/string.hpp>

static char tmp[] =
R"([b]Forest Walk[/b]
Drawn for [fa=Ipsum][generic=https://example.com/ipsum]a friend[/generic][/fa].

[if=site in weasyl,ib]Thanks for all the faves![/if][else]Thanks![/else]
[if=define==wip][i]Work in progress.[/i][/if]

Featuring [ib]Lorem[/ib], [weasyl]Dolor Sit[/weasyl] and [mastodon]@amet@example.social[/mastodon].
Previous part: [siteurl][sf=https://sofurry.com/view/1][eka=https://aryion.com/g4/view/2]Part one[/eka][/sf][/siteurl]

Art by [self][/self])";

int main()
{
    using namespace tagsmith::literals;

    tagsmith::user_config const users
    {
        {"aryion", "Me"},
        {"furaffinity", "Me"},
        {"weasyl", "Me Too"},
        {"inkbunny", "Me"},
        {"sofurry", "Me"},
        {"twitter", "@me"},
        {"mastodon", "@me@example.social"}
    };
    tagsmith::flag_set const defines{"wip"};

    try
    {
        tagsmith::description desc(tmp);
        tagsmith::print_ast(std::cout, desc);
        for (auto const& out : tagsmith::generate(desc, users, defines))
        {
            std::cout << "----------------------- " << out.file() << "\n";
            std::cout << out.text;
            for (auto const& warning : out.warnings)
                std::cout << "(warning: " << warning << ")\n";
        }
        std::cout << "-----------------------\n";
        std::cout << tagsmith::to_string("[b]Inline[/b] [url]https://example.com[/url]"_desc,
            {tagsmith::site_registry::builtin(), tagsmith::site_registry::builtin().get("weasyl"), users, defines}) << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what();
    }
}
