/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_OFFICE_HPP_INCLUDED
#define TAGSMITH_OFFICE_HPP_INCLUDED

#include <tagsmith/story.hpp>
#include <boost/filesystem/path.hpp>
#include <vector>

namespace tagsmith
{
    class office_error : public std::runtime_error
    {
    public:
        using runtime_error::runtime_error;
    };

    // Drives a headless LibreOffice.
    class office_converter : public document_converter
    {
        boost::filesystem::path _program;

    public:
        TAGSMITH_API explicit office_converter(std::string const& program = "libreoffice");

        // Lines are trimmed and joined with LF.
        TAGSMITH_API std::string extract(std::string const& path) override;

        TAGSMITH_API std::string convert(std::string_view text, style_pair const& styles) override;
    };

    // True for the argv of an interactive LibreOffice Writer.
    TAGSMITH_API bool is_writer_command(std::vector<std::string> const& argv);

    // A running Writer makes `--cat` and `--convert-to` yield nothing or fail.
    TAGSMITH_API bool writer_running();
}

#endif
