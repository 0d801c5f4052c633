#include "color_formatter.h"

#include <utility>

namespace ntree {

ColorFormatter::ColorFormatter(ThemeColors colors, bool colorize)
    : colors_(std::move(colors)),
      colorize_(colorize) {}

std::string ColorFormatter::Paint(std::string_view key, std::string_view text) const {
    if (text.empty()) {
        return {};
    }
    return Theme::ApplyColor(colors_.get(key), text, colors_, !colorize_);
}

std::string ColorFormatter::PaintWord(std::string text, std::string_view word, std::string_view key) const {
    if (!colorize_ || word.empty()) {
        return text;
    }
    auto pos = text.find(word);
    if (pos == std::string::npos) {
        return text;
    }
    return text.replace(pos, word.size(), Paint(key, word));
}

std::string ColorFormatter::make_usage(const CLI::App* app, std::string name) const {
    std::string usage = Formatter::make_usage(app, name);
    usage = PaintWord(std::move(usage), get_label("Usage"), "help_usage_label");
    return PaintWord(std::move(usage), name, "help_usage_command");
}

std::string ColorFormatter::make_group(std::string group,
                                       bool is_positional,
                                       std::vector<const CLI::Option*> opts) const {
    std::string text = Formatter::make_group(group, is_positional, std::move(opts));
    return PaintWord(std::move(text), group, "help_option_group");
}

std::string ColorFormatter::make_option_name(const CLI::Option* opt, bool is_positional) const {
    return Paint("help_option_name", Formatter::make_option_name(opt, is_positional));
}

std::string ColorFormatter::make_option_opts(const CLI::Option* opt) const {
    return Paint("help_option_opts", Formatter::make_option_opts(opt));
}

std::string ColorFormatter::make_option_desc(const CLI::Option* opt) const {
    return Paint("help_option_desc", Formatter::make_option_desc(opt));
}

std::string ColorFormatter::make_description(const CLI::App* app) const {
    return Paint("help_description", Formatter::make_description(app));
}

std::string ColorFormatter::make_footer(const CLI::App* app) const {
    return Paint("help_footer", Formatter::make_footer(app));
}

} // namespace ntree
