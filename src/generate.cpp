/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/generate.hpp>
#include <tagsmith/render/string.hpp>
#include <future>

namespace tagsmith
{
    std::string finalize(std::string_view text)
    {
        constexpr std::string_view bom("\xEF\xBB\xBF");
        if (text.starts_with(bom))
            text.remove_prefix(bom.size());
        text = trim(text);
        std::string ret;
        if (text.empty())
            return ret;
        ret.reserve(text.size() + 1);
        std::size_t newlines = 0;
        for (std::size_t i = 0; i != text.size(); ++i)
        {
            char const c = text[i];
            if (c == '\r' && i + 1 != text.size() && text[i + 1] == '\n')
                continue;
            if (c == '\n')
            {
                if (++newlines > 2)
                    continue;
            }
            else
                newlines = 0;
            ret.push_back(c);
        }
        ret.push_back('\n');
        return ret;
    }

    site_output generate_site(description const& desc, render_context const& ctx)
    {
        site_output ret{&ctx.target, {}, {}};
        auto const report = [&ret](gap const& g)
        {
            ret.warnings.push_back(to_message(g));
        };
        ret.text = finalize(to_string(desc, ctx, report));
        return ret;
    }

    std::vector<site_output> generate
    (
        description const& desc, user_config const& users, flag_set const& defines,
        site_registry const& sites, generate_options opts
    )
    {
        std::vector<site const*> targets;
        for (auto const& s : sites)
        {
            if (users.user(s.name))
                targets.push_back(&s);
        }

        std::vector<site_output> ret;
        ret.reserve(targets.size());
        if (!opts.parallel)
        {
            for (auto const s : targets)
                ret.push_back(generate_site(desc, {sites, *s, users, defines}));
            return ret;
        }

        std::vector<std::future<site_output>> tasks;
        tasks.reserve(targets.size());
        for (auto const s : targets)
        {
            tasks.push_back(std::async(std::launch::async, [&, s]
            {
                return generate_site(desc, {sites, *s, users, defines});
            }));
        }
        for (auto& task : tasks)
            ret.push_back(task.get());
        return ret;
    }
}
