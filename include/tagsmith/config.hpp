/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_CONFIG_HPP_INCLUDED
#define TAGSMITH_CONFIG_HPP_INCLUDED

#include <tagsmith/context.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace tagsmith
{
    // Holds every problem found, not just the first.
    class config_error : public std::runtime_error
    {
        std::vector<std::string> _errors;

    public:
        TAGSMITH_API explicit config_error(std::vector<std::string> errors);

        std::vector<std::string> const& errors() const noexcept { return _errors; }
    };

    using warning_handler = fn_ptr<void(std::string const&)>;

    // Reads a JSON object mapping site names (any alias, any case) to
    // usernames. Unknown sites are skipped with a warning.
    TAGSMITH_API user_config parse_config
    (
        std::string_view json, site_registry const& sites = site_registry::builtin(),
        warning_handler warn = nullptr
    );

    // Flags must be made of letters, digits, '_' and '-'.
    TAGSMITH_API flag_set make_flags(std::vector<std::string> const& options, warning_handler warn = nullptr);

    TAGSMITH_API bool is_flag(std::string_view option) noexcept;
}

#endif
