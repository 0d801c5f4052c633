#include "renderer.h"

#include <chrono>
#include <iomanip>
#include <sstream>

#include "perf.h"

namespace ntree {

namespace {

constexpr std::size_t kOwnerWidth = 8;

std::string PadRight(const std::string& text, std::size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), ' ');
}

}  // namespace

Renderer::Renderer(const Config& config, const Theme& theme, std::ostream& out)
    : opt_(config),
      theme_(theme),
      out_(out),
      glyphs_(config.ascii() ? kAsciiGlyphs : kUnicodeGlyphs),
      size_formatter_(config),
      time_formatter_(config) {
    if (opt_.show_date()) {
        date_width_ = time_formatter_.Format(std::chrono::system_clock::now()).size();
    }
}

std::string Renderer::TreePrefix(const std::vector<bool>& branches, bool is_last) const {
    std::string prefix;
    prefix.reserve((branches.size() + 1) * 6);
    for (bool branch : branches) {
        prefix += branch ? glyphs_.vertical : glyphs_.blank;
    }
    prefix += is_last ? glyphs_.corner : glyphs_.tee;
    return prefix;
}

std::string Renderer::Decorations(const FileInfo& info) const {
    if (!opt_.has_decorations()) {
        return {};
    }
    std::vector<std::string> fields;
    if (opt_.show_permissions()) {
        std::string perms = permission_formatter_.Format(info);
        fields.push_back(perms.empty() ? std::string(PermissionFormatter::kWidth, ' ') : perms);
    }
    if (opt_.show_owner()) {
        fields.push_back(PadRight(info.owner, kOwnerWidth));
    }
    if (opt_.show_group()) {
        fields.push_back(PadRight(info.group, kOwnerWidth));
    }
    if (opt_.size_mode() != Config::SizeMode::Off) {
        fields.push_back(info.has_size ? size_formatter_.Format(info.size)
                                       : size_formatter_.Placeholder());
    }
    if (opt_.show_date()) {
        fields.push_back(info.has_mtime ? PadRight(time_formatter_.Format(info.mtime), date_width_)
                                        : std::string(date_width_, ' '));
    }

    std::string text = "[";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            text.push_back(' ');
        }
        text += fields[i];
    }
    text += "]  ";
    return text;
}

char Renderer::Indicator(const FileInfo& info) {
    if (info.is_dir) {
        return '/';
    }
    switch (info.kind) {
        case EntryKind::Socket:
            return '=';
        case EntryKind::Fifo:
            return '|';
        case EntryKind::File:
            return info.is_exec ? '*' : '\0';
        default:
            break;
    }
    return '\0';
}

std::string Renderer::StyledName(const Entry& entry, bool is_root) const {
    const FileInfo& info = entry.info;
    std::string label = info.name;
    if (!is_root && opt_.full_path()) {
        label = info.path.generic_string();
    }

    std::string text = Theme::ApplyColor(theme_.ColorFor(info), label, theme_.colors(), opt_.no_color());
    if (!is_root && opt_.classify()) {
        if (char indicator = Indicator(info); indicator != '\0') {
            text.push_back(indicator);
        }
    }
    if (!is_root && info.is_symlink() && info.has_symlink_target) {
        text += " -> ";
        text += info.symlink_target.string();
    }
    return text;
}

void Renderer::RenderRoot(const Entry& root, std::string_view annotation) {
    out_ << StyledName(root, true);
    if (!annotation.empty()) {
        out_ << ' ' << annotation;
    }
    out_ << '\n';
}

void Renderer::RenderEntry(const Entry& entry,
                           const std::vector<bool>& branches,
                           std::string_view annotation) {
    auto& perf_manager = perf::Manager::Instance();
    if (perf_manager.enabled()) {
        perf_manager.IncrementCounter("render::entries");
    }

    if (!opt_.no_indent() && !opt_.full_path()) {
        const ThemeColors& colors = theme_.colors();
        out_ << Theme::ApplyColor(colors.get("tree"), TreePrefix(branches, entry.is_last), colors,
                                  opt_.no_color());
    }
    out_ << Decorations(entry.info) << StyledName(entry, false);
    if (!annotation.empty()) {
        out_ << ' ' << annotation;
    }
    out_ << '\n';
}

void Renderer::RenderSummary(const Summary& summary) {
    std::ostringstream line;
    line << '\n' << summary.directories << (summary.directories == 1 ? " directory" : " directories");
    if (!opt_.dirs_only()) {
        line << ", " << summary.files << (summary.files == 1 ? " file" : " files");
    }
    out_ << line.str() << '\n';
}

}  // namespace ntree
