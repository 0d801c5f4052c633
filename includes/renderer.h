#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"
#include "path_source.h"
#include "permission_formatter.h"
#include "size_formatter.h"
#include "summary.h"
#include "theme.h"
#include "time_formatter.h"

namespace ntree {

// Writes tree lines to a stream. Holds no traversal state: the caller passes
// the ancestor branch flags for every entry.
class Renderer {
public:
    struct Glyphs {
        std::string_view tee;
        std::string_view corner;
        std::string_view vertical;
        std::string_view blank;
    };

    static constexpr Glyphs kUnicodeGlyphs{"├── ", "└── ", "│   ", "    "};
    static constexpr Glyphs kAsciiGlyphs{"|-- ", "`-- ", "|   ", "    "};

    Renderer(const Config& config, const Theme& theme, std::ostream& out);

    // `annotation` is appended after a single space when non-empty.
    void RenderRoot(const Entry& root, std::string_view annotation = {});
    // `branches[i]` is true when the ancestor at depth i + 1 has following
    // siblings.
    void RenderEntry(const Entry& entry,
                     const std::vector<bool>& branches,
                     std::string_view annotation = {});
    void RenderSummary(const Summary& summary);

    std::string TreePrefix(const std::vector<bool>& branches, bool is_last) const;
    std::string Decorations(const FileInfo& info) const;

private:
    std::string StyledName(const Entry& entry, bool is_root) const;
    static char Indicator(const FileInfo& info);

    const Config& opt_;
    const Theme& theme_;
    std::ostream& out_;
    Glyphs glyphs_;
    SizeFormatter size_formatter_;
    TimeFormatter time_formatter_;
    PermissionFormatter permission_formatter_;
    std::size_t date_width_ = 0;
};

}  // namespace ntree
