#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logger.h"

namespace ntree {

// Finished, validated option set for one invocation. Built by
// CommandLineParser and passed by const reference to every component.
class Config {
public:
    enum class Sort { Name, Time, Version };
    enum class ColorMode { Auto, Always, Never };
    enum class SizeMode { Off, Bytes, Human };

    static constexpr const char* kDefaultTimeFormat = "%Y-%m-%d %H:%M";

    Config() = default;

    const std::vector<std::string>& paths() const;
    std::vector<std::string>& mutable_paths();
    void set_paths(std::vector<std::string> value);

    const std::optional<std::size_t>& max_depth() const;
    void set_max_depth(std::optional<std::size_t> value);

    const std::optional<std::string>& include_pattern() const;
    void set_include_pattern(std::optional<std::string> value);

    const std::optional<std::string>& exclude_pattern() const;
    void set_exclude_pattern(std::optional<std::string> value);

    bool match_dirs() const;
    void set_match_dirs(bool value);

    bool prune() const;
    void set_prune(bool value);

    bool dirs_only() const;
    void set_dirs_only(bool value);

    bool all() const;
    void set_all(bool value);

    Sort sort() const;
    void set_sort(Sort value);

    bool reverse() const;
    void set_reverse(bool value);

    bool dirs_first() const;
    void set_dirs_first(bool value);

    const std::optional<std::size_t>& file_limit() const;
    void set_file_limit(std::optional<std::size_t> value);

    bool follow_symlinks() const;
    void set_follow_symlinks(bool value);

    ColorMode color_mode() const;
    void set_color_mode(ColorMode value);

    // Resolved from color_mode(), NO_COLOR and the output destination.
    bool no_color() const;
    void set_no_color(bool value);

    const std::optional<std::string>& theme_name() const;
    void set_theme_name(std::optional<std::string> value);

    bool ascii() const;
    void set_ascii(bool value);

    bool full_path() const;
    void set_full_path(bool value);

    bool no_indent() const;
    void set_no_indent(bool value);

    SizeMode size_mode() const;
    void set_size_mode(SizeMode value);

    bool show_permissions() const;
    void set_show_permissions(bool value);

    bool show_owner() const;
    void set_show_owner(bool value);

    bool show_group() const;
    void set_show_group(bool value);

    bool show_date() const;
    void set_show_date(bool value);

    const std::string& time_format() const;
    void set_time_format(std::string value);

    bool classify() const;
    void set_classify(bool value);

    bool no_report() const;
    void set_no_report(bool value);

    const std::optional<std::string>& output_file() const;
    void set_output_file(std::optional<std::string> value);

    bool from_file() const;
    void set_from_file(bool value);

    bool perf_logging() const;
    void set_perf_logging(bool value);

    Logger::Level log_level() const;
    void set_log_level(Logger::Level value);

    bool has_decorations() const;

private:
    std::vector<std::string> paths_;
    std::optional<std::size_t> max_depth_;
    std::optional<std::string> include_pattern_;
    std::optional<std::string> exclude_pattern_;
    std::optional<std::size_t> file_limit_;
    std::optional<std::string> theme_name_;
    std::optional<std::string> output_file_;
    std::string time_format_ = kDefaultTimeFormat;

    Sort sort_ = Sort::Name;
    ColorMode color_mode_ = ColorMode::Auto;
    SizeMode size_mode_ = SizeMode::Off;
    Logger::Level log_level_ = Logger::Level::Warning;

    bool match_dirs_ = false;
    bool prune_ = false;
    bool dirs_only_ = false;
    bool all_ = false;
    bool reverse_ = false;
    bool dirs_first_ = false;
    bool follow_symlinks_ = false;
    bool no_color_ = true;
    bool ascii_ = false;
    bool full_path_ = false;
    bool no_indent_ = false;
    bool show_permissions_ = false;
    bool show_owner_ = false;
    bool show_group_ = false;
    bool show_date_ = false;
    bool classify_ = false;
    bool no_report_ = false;
    bool from_file_ = false;
    bool perf_logging_ = false;
};

} // namespace ntree
