#include "config.h"

#include <utility>

namespace ntree {

const std::vector<std::string>& Config::paths() const { return paths_; }
std::vector<std::string>& Config::mutable_paths() { return paths_; }
void Config::set_paths(std::vector<std::string> value) { paths_ = std::move(value); }

const std::optional<std::size_t>& Config::max_depth() const { return max_depth_; }
void Config::set_max_depth(std::optional<std::size_t> value) { max_depth_ = value; }

const std::optional<std::string>& Config::include_pattern() const { return include_pattern_; }
void Config::set_include_pattern(std::optional<std::string> value) { include_pattern_ = std::move(value); }

const std::optional<std::string>& Config::exclude_pattern() const { return exclude_pattern_; }
void Config::set_exclude_pattern(std::optional<std::string> value) { exclude_pattern_ = std::move(value); }

bool Config::match_dirs() const { return match_dirs_; }
void Config::set_match_dirs(bool value) { match_dirs_ = value; }

bool Config::prune() const { return prune_; }
void Config::set_prune(bool value) { prune_ = value; }

bool Config::dirs_only() const { return dirs_only_; }
void Config::set_dirs_only(bool value) { dirs_only_ = value; }

bool Config::all() const { return all_; }
void Config::set_all(bool value) { all_ = value; }

Config::Sort Config::sort() const { return sort_; }
void Config::set_sort(Sort value) { sort_ = value; }

bool Config::reverse() const { return reverse_; }
void Config::set_reverse(bool value) { reverse_ = value; }

bool Config::dirs_first() const { return dirs_first_; }
void Config::set_dirs_first(bool value) { dirs_first_ = value; }

const std::optional<std::size_t>& Config::file_limit() const { return file_limit_; }
void Config::set_file_limit(std::optional<std::size_t> value) { file_limit_ = value; }

bool Config::follow_symlinks() const { return follow_symlinks_; }
void Config::set_follow_symlinks(bool value) { follow_symlinks_ = value; }

Config::ColorMode Config::color_mode() const { return color_mode_; }
void Config::set_color_mode(ColorMode value) { color_mode_ = value; }

bool Config::no_color() const { return no_color_; }
void Config::set_no_color(bool value) { no_color_ = value; }

const std::optional<std::string>& Config::theme_name() const { return theme_name_; }
void Config::set_theme_name(std::optional<std::string> value) { theme_name_ = std::move(value); }

bool Config::ascii() const { return ascii_; }
void Config::set_ascii(bool value) { ascii_ = value; }

bool Config::full_path() const { return full_path_; }
void Config::set_full_path(bool value) { full_path_ = value; }

bool Config::no_indent() const { return no_indent_; }
void Config::set_no_indent(bool value) { no_indent_ = value; }

Config::SizeMode Config::size_mode() const { return size_mode_; }
void Config::set_size_mode(SizeMode value) { size_mode_ = value; }

bool Config::show_permissions() const { return show_permissions_; }
void Config::set_show_permissions(bool value) { show_permissions_ = value; }

bool Config::show_owner() const { return show_owner_; }
void Config::set_show_owner(bool value) { show_owner_ = value; }

bool Config::show_group() const { return show_group_; }
void Config::set_show_group(bool value) { show_group_ = value; }

bool Config::show_date() const { return show_date_; }
void Config::set_show_date(bool value) { show_date_ = value; }

const std::string& Config::time_format() const { return time_format_; }
void Config::set_time_format(std::string value) { time_format_ = std::move(value); }

bool Config::classify() const { return classify_; }
void Config::set_classify(bool value) { classify_ = value; }

bool Config::no_report() const { return no_report_; }
void Config::set_no_report(bool value) { no_report_ = value; }

const std::optional<std::string>& Config::output_file() const { return output_file_; }
void Config::set_output_file(std::optional<std::string> value) { output_file_ = std::move(value); }

bool Config::from_file() const { return from_file_; }
void Config::set_from_file(bool value) { from_file_ = value; }

bool Config::perf_logging() const { return perf_logging_; }
void Config::set_perf_logging(bool value) { perf_logging_ = value; }

Logger::Level Config::log_level() const { return log_level_; }
void Config::set_log_level(Logger::Level value) { log_level_ = value; }

bool Config::has_decorations() const {
    return show_permissions_ || show_owner_ || show_group_ || show_date_ || size_mode_ != SizeMode::Off;
}

} // namespace ntree
