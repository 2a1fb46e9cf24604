/*//////////////////////////////////////////////////////////////////////////////
    Copyright (c) 2024-2026 Jamboree

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//////////////////////////////////////////////////////////////////////////////*/

#include <tagsmith/office.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/process.hpp>
#include <algorithm>
#include <iterator>

namespace tagsmith::detail { namespace
{
    namespace fs = boost::filesystem;
    namespace bp = boost::process;

    // Removed with everything in it on scope exit.
    struct scratch_dir
    {
        fs::path path;

        scratch_dir() : path(fs::temp_directory_path() / fs::unique_path("tagsmith-%%%%-%%%%-%%%%"))
        {
            fs::create_directories(path);
        }

        ~scratch_dir()
        {
            boost::system::error_code ec;
            fs::remove_all(path, ec);
        }

        scratch_dir(scratch_dir const&) = delete;
        scratch_dir& operator=(scratch_dir const&) = delete;
    };

    std::string read_file(fs::path const& path)
    {
        fs::ifstream in(path, std::ios::binary);
        if (!in)
            throw office_error(fmt::format("cannot read {}", path.string()));
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(fs::path const& path, std::string_view text)
    {
        fs::ofstream out(path, std::ios::binary);
        out.write(text.data(), text.size());
        if (!out)
            throw office_error(fmt::format("cannot write {}", path.string()));
    }

    // NUL-separated, as in /proc/<pid>/cmdline.
    std::vector<std::string> split_cmdline(std::string const& raw)
    {
        std::vector<std::string> ret;
        std::size_t pos = 0;
        while (pos < raw.size())
        {
            auto const n = raw.find('\0', pos);
            ret.push_back(raw.substr(pos, n - pos));
            if (n == raw.npos)
                break;
            pos = n + 1;
        }
        return ret;
    }

    void check_exit(bp::child& c, std::string_view what)
    {
        c.wait();
        if (c.exit_code() != 0)
            throw office_error(fmt::format("LibreOffice failed to {} (exit code {})", what, c.exit_code()));
    }
}}

namespace tagsmith
{
    office_converter::office_converter(std::string const& program)
      : _program(boost::process::search_path(program))
    {
        if (_program.empty())
            throw office_error(detail::fmt::format("{} not found in PATH", program));
    }

    std::string office_converter::extract(std::string const& path)
    {
        namespace bp = boost::process;
        bp::ipstream out;
        bp::child c(_program, "--cat", path, bp::std_out > out, bp::std_err > bp::null);

        std::string const text{std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>()};
        detail::check_exit(c, "extract text");
        return normalize_lines(text);
    }

    std::string office_converter::convert(std::string_view text, style_pair const& styles)
    {
        namespace bp = boost::process;
        detail::scratch_dir dir;
        auto const source = dir.path / "story.txt";
        detail::write_file(source, text);

        bp::child c
        (
            _program, "--convert-to", "rtf:Rich Text Format", "--outdir", dir.path.string(), source.string(),
            bp::std_out > bp::null, bp::std_err > bp::null
        );
        detail::check_exit(c, "convert to RTF");
        return swap_style(detail::read_file(dir.path / "story.rtf"), styles);
    }

    bool is_writer_command(std::vector<std::string> const& argv)
    {
        if (argv.empty() || argv[0].find("libreoffice") == std::string::npos)
            return false;
        return std::find(argv.begin() + 1, argv.end(), "--writer") != argv.end();
    }

    bool writer_running()
    {
        namespace fs = boost::filesystem;
        boost::system::error_code ec;
        fs::directory_iterator it("/proc", ec);
        if (ec)
            return false;
        for (fs::directory_iterator const end; it != end; it.increment(ec))
        {
            if (ec)
                return false;
            fs::ifstream in(it->path() / "cmdline", std::ios::binary);
            if (!in)
                continue;
            std::string const raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
            if (is_writer_command(detail::split_cmdline(raw)))
                return true;
        }
        return false;
    }
}
