#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config.h"
#include "file_info.h"

namespace ntree {

struct ThemeColors {
    std::unordered_map<std::string, std::string> values;
    std::string reset = "\x1b[0m";

    void set(std::string key, std::string value);
    const std::string& get(std::string_view key) const;
};

// Color table used by the renderer. Keys are element names ("dir", "link",
// "tree", ...), extension categories ("archive", "image", ...) and
// per-extension overrides stored as "*.ext".
class Theme {
public:
    // Built-in colors.
    Theme();

    const ThemeColors& colors() const { return colors_; }
    ThemeColors& mutable_colors() { return colors_; }

    // Overrides built-in colors with the named theme from the first candidate
    // database that has it. Returns false (and logs a warning) otherwise.
    bool LoadNamed(std::string_view name, const std::vector<std::filesystem::path>& databases);

    // Applies an LS_COLORS value such as "di=01;34:ln=01;36:*.tar=01;31".
    // Unknown keys and malformed items are skipped.
    void ApplyLsColors(std::string_view ls_colors);

    // Escape sequence for a name; empty when it should stay uncolored.
    std::string ColorFor(const FileInfo& info) const;

    static bool ShouldColorize(Config::ColorMode mode, bool is_terminal, bool no_color_env);
    static ThemeColors MakeFallback();
    static std::string ApplyColor(const std::string& color,
                                  std::string_view text,
                                  const ThemeColors& theme,
                                  bool no_color);

private:
    ThemeColors colors_;
};

} // namespace ntree
