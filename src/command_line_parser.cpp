#include "command_line_parser.h"

#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "color_formatter.h"
#include "platform.h"
#include "string_utils.h"
#include "theme.h"
#include "version.h"

namespace ntree {

namespace {

using ColorMode = Config::ColorMode;

class ConfigBuilder {
public:
    std::vector<std::string>& paths() { return paths_; }

    void SetAll(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_all(value); });
    }

    void SetDirsOnly(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_dirs_only(value); });
    }

    void SetMaxDepth(std::size_t depth)
    {
        actions_.emplace_back([depth](Config& cfg) { cfg.set_max_depth(depth); });
    }

    void SetFollowSymlinks(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_follow_symlinks(value); });
    }

    void SetFileLimit(std::size_t limit)
    {
        actions_.emplace_back([limit](Config& cfg) { cfg.set_file_limit(limit); });
    }

    void SetIncludePattern(std::string pattern)
    {
        actions_.emplace_back([pattern = std::move(pattern)](Config& cfg) {
            cfg.set_include_pattern(pattern);
        });
    }

    void SetExcludePattern(std::string pattern)
    {
        actions_.emplace_back([pattern = std::move(pattern)](Config& cfg) {
            cfg.set_exclude_pattern(pattern);
        });
    }

    void SetMatchDirs(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_match_dirs(value); });
    }

    void SetPrune(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_prune(value); });
    }

    void SetSort(Config::Sort sort)
    {
        actions_.emplace_back([sort](Config& cfg) { cfg.set_sort(sort); });
    }

    void SetReverse(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_reverse(value); });
    }

    void SetDirsFirst(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_dirs_first(value); });
    }

    void SetFullPath(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_full_path(value); });
    }

    void SetNoIndent(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_no_indent(value); });
    }

    void SetAscii(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_ascii(value); });
    }

    void SetClassify(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_classify(value); });
    }

    void SetColorMode(ColorMode mode)
    {
        actions_.emplace_back([mode](Config& cfg) { cfg.set_color_mode(mode); });
    }

    void SetThemeName(std::string theme)
    {
        actions_.emplace_back([theme = std::move(theme)](Config& cfg) mutable {
            cfg.set_theme_name(std::optional<std::string>(std::move(theme)));
        });
    }

    void SetSizeMode(Config::SizeMode mode)
    {
        actions_.emplace_back([mode](Config& cfg) { cfg.set_size_mode(mode); });
    }

    void SetShowPermissions(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_show_permissions(value); });
    }

    void SetShowOwner(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_show_owner(value); });
    }

    void SetShowGroup(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_show_group(value); });
    }

    void SetShowDate(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_show_date(value); });
    }

    void SetTimeFormat(std::string format)
    {
        actions_.emplace_back([format = std::move(format)](Config& cfg) { cfg.set_time_format(format); });
    }

    void SetNoReport(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_no_report(value); });
    }

    void SetOutputFile(std::string file)
    {
        actions_.emplace_back([file = std::move(file)](Config& cfg) {
            cfg.set_output_file(std::optional<std::string>(file));
        });
    }

    void SetFromFile(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_from_file(value); });
    }

    void SetLogLevel(Logger::Level level)
    {
        actions_.emplace_back([level](Config& cfg) { cfg.set_log_level(level); });
    }

    void SetPerfLogging(bool value)
    {
        actions_.emplace_back([value](Config& cfg) { cfg.set_perf_logging(value); });
    }

    Config Build() const
    {
        Config cfg;
        cfg.set_paths(paths_);
        for (const auto& action : actions_) {
            action(cfg);
        }
        if (cfg.paths().empty() && !cfg.from_file()) {
            cfg.mutable_paths().push_back(".");
        }
        return cfg;
    }

private:
    std::vector<std::function<void(Config&)>> actions_{};
    std::vector<std::string> paths_{};
};

} // namespace

CommandLineParser::CommandLineParser() = default;

CommandLineParser::~CommandLineParser() = default;

Config CommandLineParser::Parse(int argc, const char* const* argv) {
    ConfigBuilder builder;

    program_ = std::make_unique<CLI::App>(
        "Display directories as an indented tree (the current directory by default).", "ntree");
    CLI::App& program = *program_;
    const bool colorize_help = std::getenv("NO_COLOR") == nullptr && Platform::isOutputTerminal();
    program.formatter(std::make_shared<ColorFormatter>(Theme::MakeFallback(), colorize_help));
    program.set_version_flag("--version", Version::FullString());
    program.footer(R"(PATTERN is a wildcard: '*' any run, '?' one character, [a-z] and [!a-z]
character classes, '|' separates alternatives. With --fromfile, PATH names the
listing to read ('-' or nothing reads standard input).

Exit status:
 0  if OK,
 1  if a directory could not be read,
 2  if a PATH or the output file could not be opened.)");

    program.add_option("paths", builder.paths(), "directories to list")->type_name("PATH");

    auto listing = program.add_option_group("Listing options");
    listing->add_flag_callback("-a,--all", [&]() { builder.SetAll(true); },
        "show hidden entries");
    listing->add_flag_callback("-d,--dirs-only", [&]() { builder.SetDirsOnly(true); },
        "list directories only");
    auto level_option = listing->add_option_function<long long>("-L,--level",
        [&](const long long& depth) {
            if (depth < 1) {
                throw CLI::ValidationError("--level", "LEVEL must be greater than 0");
            }
            builder.SetMaxDepth(static_cast<std::size_t>(depth));
        },
        "descend at most LEVEL directories deep");
    level_option->type_name("LEVEL");
    listing->add_flag_callback("-l,--follow", [&]() { builder.SetFollowSymlinks(true); },
        "follow symbolic links to directories");
    auto limit_option = listing->add_option_function<long long>("--filelimit",
        [&](const long long& limit) {
            if (limit < 0) {
                throw CLI::ValidationError("--filelimit", "N must be non-negative");
            }
            builder.SetFileLimit(static_cast<std::size_t>(limit));
        },
        "do not descend into directories with more than N entries");
    limit_option->type_name("N");

    auto filtering = program.add_option_group("Filtering options");
    auto include_option = filtering->add_option_function<std::string>("-P,--pattern",
        [&](const std::string& pattern) { builder.SetIncludePattern(pattern); },
        "list only files that match PATTERN");
    include_option->type_name("PATTERN");
    auto exclude_option = filtering->add_option_function<std::string>("-I,--exclude",
        [&](const std::string& pattern) { builder.SetExcludePattern(pattern); },
        "do not list entries that match PATTERN");
    exclude_option->type_name("PATTERN");
    filtering->add_flag_callback("--matchdirs", [&]() { builder.SetMatchDirs(true); },
        "apply the -P pattern to directory names too");
    filtering->add_flag_callback("--prune", [&]() { builder.SetPrune(true); },
        "omit directories that have nothing to show");

    const std::map<std::string, Config::Sort> sort_map{
        {"name", Config::Sort::Name},
        {"time", Config::Sort::Time},
        {"mtime", Config::Sort::Time},
        {"version", Config::Sort::Version},
    };

    auto sorting = program.add_option_group("Sorting options");
    sorting->add_flag_callback("-t,--sort-by-time", [&]() { builder.SetSort(Config::Sort::Time); },
        "sort by modification time, oldest first");
    sorting->add_flag_callback("-v,--version-sort", [&]() { builder.SetSort(Config::Sort::Version); },
        "natural sort of version numbers within names");
    auto sort_option = sorting->add_option_function<Config::Sort>("--sort",
        [&](const Config::Sort& sort) { builder.SetSort(sort); },
        R"(sort by WORD: name, time, version
(default: name))");
    sort_option->type_name("WORD");
    sort_option->transform(CLI::CheckedTransformer(sort_map, CLI::ignore_case).description(""));
    sort_option->default_str("name");
    sorting->add_flag_callback("-r,--reverse", [&]() { builder.SetReverse(true); },
        "reverse the sort order");
    sorting->add_flag_callback("--dirsfirst", [&]() { builder.SetDirsFirst(true); },
        "list directories before files");

    const std::map<std::string, ColorMode> color_map{
        {"auto", ColorMode::Auto},
        {"always", ColorMode::Always},
        {"never", ColorMode::Never},
    };

    auto appearance = program.add_option_group("Appearance options");
    appearance->add_flag_callback("-f,--full-path", [&]() { builder.SetFullPath(true); },
        "print the full path of each entry");
    appearance->add_flag_callback("-i,--no-indent", [&]() { builder.SetNoIndent(true); },
        "do not print indentation lines");
    appearance->add_flag_callback("-A,--ascii", [&]() { builder.SetAscii(true); },
        "draw the tree with ASCII characters");
    appearance->add_flag_callback("-F,--classify", [&]() { builder.SetClassify(true); },
        "append / for directories, * for executables, = for sockets, | for FIFOs");
    appearance->add_flag_callback("-C", [&]() { builder.SetColorMode(ColorMode::Always); },
        "always colorize the output");
    appearance->add_flag_callback("-n,--no-color", [&]() { builder.SetColorMode(ColorMode::Never); },
        "never colorize the output");
    auto color_option = appearance->add_option_function<ColorMode>("--color",
        [&](const ColorMode& color) { builder.SetColorMode(color); },
        R"(colorize the output: auto, always,
never (default: auto))");
    color_option->type_name("WHEN");
    color_option->transform(CLI::CheckedTransformer(color_map, CLI::ignore_case).description(""));
    color_option->default_str("auto");
    auto theme_option = appearance->add_option_function<std::string>("--theme",
        [&](const std::string& raw_theme) {
            std::string theme = StringUtils::Trim(raw_theme);
            if (theme.empty()) {
                throw CLI::ValidationError("--theme", "theme name cannot be empty");
            }
            if (theme.find('/') != std::string::npos || theme.find('\\') != std::string::npos) {
                throw CLI::ValidationError("--theme", "theme name must not contain path separators");
            }
            builder.SetThemeName(std::move(theme));
        },
        "use the named color theme from ntree.sqlite3");
    theme_option->type_name("NAME");

    auto information = program.add_option_group("Information options");
    information->add_flag_callback("-s,--size", [&]() { builder.SetSizeMode(Config::SizeMode::Bytes); },
        "print the size in bytes of each entry");
    information->add_flag_callback("-H,--human-readable", [&]() { builder.SetSizeMode(Config::SizeMode::Human); },
        "print sizes in a human readable format (e.g. 1K 234M 2G)");
    information->add_flag_callback("-p,--permissions", [&]() { builder.SetShowPermissions(true); },
        "print the permissions of each entry");
    information->add_flag_callback("-u,--owner", [&]() { builder.SetShowOwner(true); },
        "print the owner of each entry");
    information->add_flag_callback("-g,--group", [&]() { builder.SetShowGroup(true); },
        "print the group of each entry");
    information->add_flag_callback("-D,--mod-date", [&]() { builder.SetShowDate(true); },
        "print the last modification date");
    auto timefmt_option = information->add_option_function<std::string>("--timefmt",
        [&](const std::string& format) {
            if (format.empty()) {
                throw CLI::ValidationError("--timefmt", "FORMAT cannot be empty");
            }
            builder.SetTimeFormat(format);
            builder.SetShowDate(true);
        },
        "strftime(3) FORMAT for dates, implies -D");
    timefmt_option->type_name("FORMAT");

    auto io = program.add_option_group("Input/Output options");
    auto output_option = io->add_option_function<std::string>("-o,--output",
        [&](const std::string& file) { builder.SetOutputFile(file); },
        "write the tree to FILE instead of standard output");
    output_option->type_name("FILE");
    io->add_flag_callback("--fromfile", [&]() { builder.SetFromFile(true); },
        "read paths from a listing instead of the filesystem");
    io->add_flag_callback("--noreport", [&]() { builder.SetNoReport(true); },
        "omit the directory and file count");

    const std::map<std::string, Logger::Level> log_level_map{
        {"error", Logger::Level::Error},
        {"warn", Logger::Level::Warning},
        {"warning", Logger::Level::Warning},
        {"info", Logger::Level::Info},
        {"debug", Logger::Level::Debug},
        {"trace", Logger::Level::Trace},
    };

    auto debug = program.add_option_group("Debug options");
    auto log_option = debug->add_option_function<Logger::Level>("--log-level",
        [&](const Logger::Level& level) { builder.SetLogLevel(level); },
        R"(diagnostics verbosity: error, warn, info,
debug, trace (default: warn))");
    log_option->type_name("LEVEL");
    log_option->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case).description(""));
    log_option->default_str("warn");
    debug->add_flag_callback("--perf-debug", [&]() { builder.SetPerfLogging(true); },
        "report timings and counters on standard error");

    program.parse(argc, argv);

    Config config = builder.Build();
    if (config.from_file() && config.paths().size() > 1) {
        throw CLI::ValidationError("--fromfile", "accepts at most one listing PATH");
    }
    return config;
}

int CommandLineParser::Exit(const CLI::ParseError& error, std::ostream& out, std::ostream& err) const {
    if (!program_) {
        err << "ntree: " << error.what() << '\n';
        return error.get_exit_code();
    }
    return program_->exit(error, out, err);
}

} // namespace ntree
