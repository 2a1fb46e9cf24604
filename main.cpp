#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>
#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Formatters/MessageOnlyFormatter.h>
#include <plog/Appenders/ColorConsoleAppender.h>
#include <tagsmith/config.hpp>
#include <tagsmith/debug.hpp>
#include <tagsmith/generate.hpp>
#include <tagsmith/office.hpp>
#include <tagsmith/story.hpp>

namespace fs = boost::filesystem;

namespace
{
    struct options
    {
        std::string output = "./out";
        std::string config = "./config.json";
        std::optional<std::string> description;
        std::optional<std::string> story;
        std::vector<std::string> files;
        std::vector<std::string> defines;
        bool keep = false;
        bool ignore_empty = false;
        bool ast = false;
    };

    struct usage_error : std::runtime_error
    {
        using runtime_error::runtime_error;
    };

    int print_usage(std::ostream& out)
    {
        out << "usage: tagsmith [options]\n"
            << "\n"
            << "  -o, --output-dir <dir>         default: ./out\n"
            << "  -c, --config <path>            default: ./config.json\n"
            << "  -D, --define-option <flag>     define a flag for [if=define ...], repeatable\n"
            << "  -d, --description <path>       description to convert for each website\n"
            << "  -s, --story <path>             story to convert for each website\n"
            << "  -f, --file <path>              file to copy into the output, repeatable\n"
            << "  -k, --keep-out-dir             keep existing output directory contents\n"
            << "  -I, --ignore-empty-files       do not fail on blank input files\n"
            << "      --ast                      print the parsed description\n"
            << "  -v, --verbose                  log debug messages\n"
            << "  -h, --help                     show this help\n";
        return 0;
    }

    options parse_args(int argc, char** argv)
    {
        options opts;
        for (int i = 1; i < argc; ++i)
        {
            std::string const arg = argv[i];
            auto const value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw usage_error(arg + " requires an argument");
                return argv[++i];
            };
            if (arg == "-o" || arg == "--output-dir")
                opts.output = value();
            else if (arg == "-c" || arg == "--config")
                opts.config = value();
            else if (arg == "-D" || arg == "--define-option")
                opts.defines.push_back(value());
            else if (arg == "-d" || arg == "--description")
                opts.description = value();
            else if (arg == "-s" || arg == "--story")
                opts.story = value();
            else if (arg == "-f" || arg == "--file")
                opts.files.push_back(value());
            else if (arg == "-k" || arg == "--keep-out-dir")
                opts.keep = true;
            else if (arg == "-I" || arg == "--ignore-empty-files")
                opts.ignore_empty = true;
            else if (arg == "--ast")
                opts.ast = true;
            else if (arg == "-v" || arg == "--verbose")
                continue;
            else
                throw usage_error("unknown argument " + arg);
        }

        if (!opts.description && !opts.story && opts.files.empty())
            throw usage_error("at least one of --description, --story or --file must be set");
        if (fs::exists(opts.output) && !fs::is_directory(opts.output))
            throw usage_error("--output-dir " + opts.output + " must be a directory or not exist");
        if (opts.description && !fs::is_regular_file(*opts.description))
            throw usage_error("--description " + *opts.description + " is not a valid file");
        if (opts.story && !fs::is_regular_file(*opts.story))
            throw usage_error("--story " + *opts.story + " is not a valid file");
        for (auto const& file : opts.files)
        {
            if (!fs::is_regular_file(file))
                throw usage_error("--file " + file + " is not a valid file");
        }
        if ((opts.description || opts.story) && !fs::is_regular_file(opts.config))
            throw usage_error("--config " + opts.config + " is not a valid file");
        return opts;
    }

    std::string read_text(std::string const& path)
    {
        if (fs::file_size(path) == 0)
            return {};
        boost::iostreams::mapped_file_source file(path);
        return std::string(file.data(), file.size());
    }

    void write_text(fs::path const& path, std::string_view text)
    {
        fs::ofstream out(path, std::ios::binary);
        out.write(text.data(), text.size());
        if (!out)
            throw std::runtime_error("cannot write " + path.string());
        PLOGD << "wrote " << path.string();
    }

    // Starts LibreOffice only when a document actually needs it.
    class lazy_office : public tagsmith::document_converter
    {
        std::unique_ptr<tagsmith::office_converter> _office;
        bool _ignore_empty;

        tagsmith::office_converter& get()
        {
            if (!_office)
            {
                _office = std::make_unique<tagsmith::office_converter>();
                if (tagsmith::writer_running())
                {
                    PLOGW << "LibreOffice Writer appears to be running; this command may "
                          << (_ignore_empty ? "output empty files" : "fail") << " until it is closed";
                }
            }
            return *_office;
        }

    public:
        explicit lazy_office(bool ignore_empty) : _ignore_empty(ignore_empty) {}

        std::string extract(std::string const& path) override
        {
            return get().extract(path);
        }

        std::string convert(std::string_view text, tagsmith::style_pair const& styles) override
        {
            return get().convert(text, styles);
        }
    };

    // Plain text files are read directly; anything else goes through LibreOffice.
    std::string load_document(std::string const& path, lazy_office& office)
    {
        if (fs::path(path).extension() == ".txt")
            return tagsmith::normalize_lines(read_text(path));
        return office.extract(path);
    }

    // Moves an existing output directory aside, and puts it back unless
    // the run is committed.
    class output_guard
    {
        fs::path _out;
        fs::path _backup;
        bool _committed = false;

    public:
        output_guard(fs::path const& out, bool keep) : _out(fs::absolute(out))
        {
            _out.remove_trailing_separator();
            if (!keep && fs::is_directory(_out))
            {
                // A sibling, so the rename stays on one filesystem.
                _backup = _out.parent_path() / fs::unique_path(_out.filename().string() + ".old-%%%%-%%%%");
                fs::rename(_out, _backup);
                PLOGD << "moved " << _out.string() << " aside to " << _backup.string();
            }
            fs::create_directories(_out);
        }

        ~output_guard()
        {
            boost::system::error_code ec;
            if (_committed)
            {
                if (!_backup.empty())
                    fs::remove_all(_backup, ec);
                return;
            }
            if (_backup.empty())
                return;
            fs::remove_all(_out, ec);
            fs::rename(_backup, _out, ec);
            if (ec)
                PLOGE << "could not restore " << _out.string() << " from " << _backup.string() << ": " << ec.message();
            else
                PLOGI << "restored previous " << _out.string();
        }

        output_guard(output_guard const&) = delete;
        output_guard& operator=(output_guard const&) = delete;

        void commit() { _committed = true; }
    };

    void log_warning(std::string const& msg)
    {
        PLOGW << msg;
    }

    bool check_blank(bool blank, std::string const& what, std::string const& path, bool ignore_empty)
    {
        if (!blank)
            return false;
        if (!ignore_empty)
            throw std::runtime_error(what + " " + path + " is empty");
        PLOGW << "ignoring empty " << what << " " << path;
        return true;
    }

    void process_description
    (
        options const& opts, tagsmith::user_config const& users,
        tagsmith::flag_set const& defines, lazy_office& office
    )
    {
        auto const& path = *opts.description;
        auto const text = load_document(path, office);
        // A skipped blank description still writes empty files.
        check_blank(tagsmith::is_blank(text), "description", path, opts.ignore_empty);

        tagsmith::description desc(text);
        if (opts.ast)
            tagsmith::print_ast(std::cout, desc);

        auto const outputs = tagsmith::generate(desc, users, defines, tagsmith::site_registry::builtin(), {true});
        for (auto const& out : outputs)
        {
            for (auto const& warning : out.warnings)
                PLOGW << out.target->name << ": " << warning;
            write_text(fs::path(opts.output) / std::string(out.file()), out.text);
        }
        PLOGI << "generated descriptions for " << outputs.size() << " website(s)";
    }

    void process_story(options const& opts, tagsmith::user_config const& users, lazy_office& office)
    {
        auto const& path = *opts.story;
        auto const story = tagsmith::normalize_story(load_document(path, office));
        if (check_blank(story.empty, "story", path, opts.ignore_empty))
            return;

        auto const name = fs::path(path).stem().string();
        for (auto const& out : tagsmith::build_story(story, users, office))
        {
            char const* ext = "";
            switch (out.format)
            {
            case tagsmith::story_format::txt: ext = ".txt"; break;
            case tagsmith::story_format::md: ext = ".md"; break;
            case tagsmith::story_format::rtf: ext = ".rtf"; break;
            case tagsmith::story_format::none: continue;
            }
            write_text(fs::path(opts.output) / (name + ext), out.text);
        }
        PLOGI << "generated story files for " << name;
    }

    void run(options const& opts)
    {
        auto const defines = tagsmith::make_flags(opts.defines, log_warning);
        tagsmith::user_config users;
        if (opts.description || opts.story)
            users = tagsmith::parse_config(read_text(opts.config), tagsmith::site_registry::builtin(), log_warning);

        lazy_office office(opts.ignore_empty);
        output_guard guard(opts.output, opts.keep);
        if (opts.story)
            process_story(opts, users, office);
        if (opts.description)
            process_description(opts, users, defines, office);
        for (auto const& file : opts.files)
        {
            fs::path const src(file);
            fs::copy_file(src, fs::path(opts.output) / src.filename(), fs::copy_options::overwrite_existing);
            PLOGD << "copied " << file;
        }
        guard.commit();
    }
}

int main(int argc, char** argv)
{
    static plog::ColorConsoleAppender<plog::MessageOnlyFormatter> console;

    auto severity = plog::info;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view const arg = argv[i];
        if (arg == "-h" || arg == "--help")
            return print_usage(std::cout);
        if (arg == "-v" || arg == "--verbose")
            severity = plog::debug;
    }
    plog::init(severity, &console);

    try
    {
        run(parse_args(argc, argv));
    }
    catch (usage_error const& e)
    {
        std::cerr << "tagsmith: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 2;
    }
    catch (tagsmith::config_error const& e)
    {
        PLOGE << "invalid configuration:";
        for (auto const& error : e.errors())
            PLOGE << "  " << error;
        return 1;
    }
    catch (tagsmith::parse_error const& e)
    {
        PLOGE << "description error at offset " << e.position() << ": " << e.what();
        return 1;
    }
    catch (std::exception const& e)
    {
        PLOGE << e.what();
        return 1;
    }
    return 0;
}
