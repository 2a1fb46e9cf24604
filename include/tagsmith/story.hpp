/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/
#ifndef TAGSMITH_STORY_HPP_INCLUDED
#define TAGSMITH_STORY_HPP_INCLUDED

#include <tagsmith/context.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include <map>

namespace tagsmith
{
    class story_error : public std::runtime_error
    {
    public:
        using runtime_error::runtime_error;
    };

    struct story_text
    {
        std::string txt;   // CRLF, at most one blank line between paragraphs.
        std::string md;    // As `txt`, with Markdown-significant marks escaped.
        std::string plain; // LF, no blank lines.
        bool empty = true;
    };

    TAGSMITH_API story_text normalize_story(std::string_view text);

    // Maps both the style number and the style name to its control words.
    using style_table = std::map<std::string, std::string, std::less<>>;

    TAGSMITH_API style_table rtf_styles(std::string_view rtf);

    struct style_pair
    {
        std::string from = "Preformatted Text";
        std::string to = "Normal";
    };

    // Rewrites every use of `styles.from` as `styles.to`.
    TAGSMITH_API std::string swap_style(std::string_view rtf, style_pair const& styles = {});

    class document_converter
    {
    public:
        virtual ~document_converter() = default;

        // The text content of the document at `path`.
        virtual std::string extract(std::string const& path) = 0;

        // A rich text document of `text` in the `styles.to` style.
        virtual std::string convert(std::string_view text, style_pair const& styles) = 0;
    };

    struct story_output
    {
        story_format format;
        std::string text;
    };

    // One output per format the configured sites need, in txt, md, rtf order.
    TAGSMITH_API std::vector<story_output> build_story
    (
        story_text const& story, user_config const& users, document_converter& conv,
        site_registry const& sites = site_registry::builtin(), style_pair const& styles = {}
    );
}

#endif
