#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "theme.h"

namespace ntree {

// CLI11 help formatter. Keeps CLI11's layout and wraps the usage label, group
// titles and option columns in the help_* colors of a theme.
class ColorFormatter : public CLI::Formatter {
public:
    ColorFormatter(ThemeColors colors, bool colorize);

    std::string make_usage(const CLI::App* app, std::string name) const override;
    std::string make_group(std::string group, bool is_positional, std::vector<const CLI::Option*> opts) const override;
    std::string make_option_name(const CLI::Option* opt, bool is_positional) const override;
    std::string make_option_opts(const CLI::Option* opt) const override;
    std::string make_option_desc(const CLI::Option* opt) const override;
    std::string make_description(const CLI::App* app) const override;
    std::string make_footer(const CLI::App* app) const override;

private:
    std::string Paint(std::string_view key, std::string_view text) const;
    // Colors the first occurrence of `word` inside `text`.
    std::string PaintWord(std::string text, std::string_view word, std::string_view key) const;

    ThemeColors colors_;
    bool colorize_;
};

} // namespace ntree
