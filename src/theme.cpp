#include "theme.h"

#include "logger.h"
#include "perf.h"
#include "string_utils.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <sqlite3.h>

namespace ntree {
namespace {

class ThemeSupport final {
public:
    static std::string MakeAnsiFromRgb(std::uint32_t rgb)
    {
        int r = static_cast<int>((rgb >> 16) & 0xFF);
        int g = static_cast<int>((rgb >> 8) & 0xFF);
        int b = static_cast<int>(rgb & 0xFF);
        std::ostringstream out;
        out << "\x1b[38;2;" << r << ';' << g << ';' << b << 'm';
        return out.str();
    }

    static std::string MakeAnsiFromSgr(std::string_view sgr)
    {
        if (sgr.empty()) {
            return {};
        }
        std::string out = "\x1b[";
        out.append(sgr);
        out.push_back('m');
        return out;
    }

    static std::string_view CategoryFor(std::string_view extension)
    {
        static const std::unordered_map<std::string_view, std::string_view> kCategories = {
            {"tar", "archive"}, {"tgz", "archive"}, {"gz", "archive"},   {"bz2", "archive"},
            {"xz", "archive"},  {"zst", "archive"}, {"zip", "archive"},  {"7z", "archive"},
            {"rar", "archive"}, {"deb", "archive"}, {"rpm", "archive"},  {"jar", "archive"},
            {"png", "image"},   {"jpg", "image"},   {"jpeg", "image"},   {"gif", "image"},
            {"bmp", "image"},   {"svg", "image"},   {"webp", "image"},   {"tif", "image"},
            {"tiff", "image"},  {"ico", "image"},   {"mp3", "audio"},    {"flac", "audio"},
            {"wav", "audio"},   {"ogg", "audio"},   {"m4a", "audio"},    {"aac", "audio"},
            {"opus", "audio"},  {"mp4", "video"},   {"mkv", "video"},    {"avi", "video"},
            {"mov", "video"},   {"webm", "video"},  {"wmv", "video"},    {"pdf", "document"},
            {"doc", "document"}, {"docx", "document"}, {"odt", "document"}, {"md", "document"},
            {"txt", "document"}, {"rtf", "document"}, {"xls", "document"}, {"xlsx", "document"},
        };
        auto it = kCategories.find(extension);
        if (it == kCategories.end()) {
            return {};
        }
        return it->second;
    }

    static std::string_view ElementForLsKey(std::string_view key)
    {
        static const std::unordered_map<std::string_view, std::string_view> kKeys = {
            {"di", "dir"},      {"ln", "link"},     {"or", "dead_link"},
            {"ex", "executable_file"}, {"so", "socket"}, {"pi", "fifo"},
            {"bd", "blockdev"}, {"cd", "chardev"},  {"fi", "file"},
        };
        auto it = kKeys.find(key);
        if (it == kKeys.end()) {
            return {};
        }
        return it->second;
    }
};

struct SqliteCloser {
    void operator()(sqlite3* db) const noexcept
    {
        if (db) {
            sqlite3_close(db);
        }
    }
};

struct SqliteStmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteCloser>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtFinalizer>;

SqliteDbPtr OpenConfigDatabase(const std::filesystem::path& path)
{
    sqlite3* raw = nullptr;
    const std::string utf8 = path.string();
    int rc = sqlite3_open_v2(utf8.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        if (raw) {
            Logger::instance().debug("failed to open config database '", utf8, "': ", sqlite3_errmsg(raw));
            sqlite3_close(raw);
        } else {
            Logger::instance().debug("failed to open config database '", utf8, "': ", sqlite3_errstr(rc));
        }
        return {};
    }
    return SqliteDbPtr(raw);
}

bool LoadThemeColors(sqlite3* db, int theme_id, ThemeColors& target, std::size_t& entries_out)
{
    static constexpr const char* kSql =
        "SELECT element, c.value FROM Theme_colors t "
        "JOIN Colors c ON t.color_id = c.id WHERE t.id = ?1;";
    entries_out = 0;
    sqlite3_stmt* stmt_raw = nullptr;
    int rc = sqlite3_prepare_v2(db, kSql, -1, &stmt_raw, nullptr);
    if (rc != SQLITE_OK) {
        Logger::instance().debug("theme query failed: ", sqlite3_errmsg(db));
        return false;
    }
    SqliteStmtPtr stmt(stmt_raw);
    rc = sqlite3_bind_int(stmt.get(), 1, theme_id);
    if (rc != SQLITE_OK) {
        return false;
    }

    std::size_t entries = 0;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* element = sqlite3_column_text(stmt.get(), 0);
        if (!element) {
            continue;
        }
        std::string key = StringUtils::ToLower(reinterpret_cast<const char*>(element));
        std::uint32_t rgb = static_cast<std::uint32_t>(sqlite3_column_int64(stmt.get(), 1)) & 0xFFFFFFu;
        target.set(std::move(key), ThemeSupport::MakeAnsiFromRgb(rgb));
        ++entries;
    }

    entries_out = entries;
    return rc == SQLITE_DONE && entries > 0;
}

std::optional<int> LookupThemeId(sqlite3* db, std::string_view name)
{
    static constexpr const char* kSql =
        "SELECT id FROM Themes WHERE LOWER(name) = LOWER(?1) LIMIT 1;";
    sqlite3_stmt* stmt_raw = nullptr;
    int rc = sqlite3_prepare_v2(db, kSql, -1, &stmt_raw, nullptr);
    if (rc != SQLITE_OK) {
        Logger::instance().debug("theme lookup failed: ", sqlite3_errmsg(db));
        return std::nullopt;
    }
    SqliteStmtPtr stmt(stmt_raw);
    rc = sqlite3_bind_text(stmt.get(), 1, name.data(), static_cast<int>(name.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return std::nullopt;
    }
    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return std::nullopt;
}

} // namespace

void ThemeColors::set(std::string key, std::string value)
{
    values[std::move(key)] = std::move(value);
}

const std::string& ThemeColors::get(std::string_view key) const
{
    static const std::string empty;
    auto it = values.find(std::string(key));
    if (it == values.end()) return empty;
    return it->second;
}

Theme::Theme()
    : colors_(MakeFallback()) {}

ThemeColors Theme::MakeFallback()
{
    ThemeColors theme;
    theme.set("dir", "\x1b[1;34m");
    theme.set("link", "\x1b[1;36m");
    theme.set("dead_link", "\x1b[1;31m");
    theme.set("executable_file", "\x1b[1;32m");
    theme.set("socket", "\x1b[1;35m");
    theme.set("fifo", "\x1b[33m");
    theme.set("blockdev", "\x1b[1;33m");
    theme.set("chardev", "\x1b[1;33m");
    theme.set("file", "");
    theme.set("archive", "\x1b[1;31m");
    theme.set("image", "\x1b[1;35m");
    theme.set("audio", "\x1b[36m");
    theme.set("video", "\x1b[1;35m");
    theme.set("document", "\x1b[37m");
    theme.set("tree", "");
    theme.set("help_usage_label", "\x1b[33m");
    theme.set("help_usage_command", "\x1b[33m");
    theme.set("help_option_group", "\x1b[36m");
    theme.set("help_option_name", "\x1b[33m");
    theme.set("help_option_opts", "\x1b[34m");
    theme.set("help_option_desc", "\x1b[32m");
    theme.set("help_footer", "\x1b[35m");
    theme.set("help_description", "\x1b[35m");
    return theme;
}

bool Theme::LoadNamed(std::string_view requested, const std::vector<std::filesystem::path>& databases)
{
    auto& perf_manager = perf::Manager::Instance();
    const bool perf_enabled = perf_manager.enabled();
    std::optional<perf::Timer> timer;
    if (perf_enabled) {
        timer.emplace("theme::load_named");
    }

    std::string name = StringUtils::Trim(requested);
    bool has_separator = name.find('/') != std::string::npos || name.find('\\') != std::string::npos;
    if (name.empty() || has_separator) {
        Logger::instance().warn("theme '", requested, "' not found");
        return false;
    }

    for (const auto& candidate : databases) {
        if (candidate.empty()) continue;
        auto db = OpenConfigDatabase(candidate);
        if (!db) {
            continue;
        }
        auto theme_id = LookupThemeId(db.get(), name);
        if (!theme_id) {
            continue;
        }
        ThemeColors loaded = colors_;
        std::size_t entries = 0;
        if (!LoadThemeColors(db.get(), *theme_id, loaded, entries)) {
            continue;
        }
        colors_ = std::move(loaded);
        Logger::instance().debug("loaded theme '", name, "' (", entries, " colors) from ", candidate.string());
        if (perf_enabled) {
            perf_manager.IncrementCounter("theme::entries_loaded", entries);
        }
        return true;
    }

    Logger::instance().warn("theme '", requested, "' not found, using built-in colors");
    return false;
}

void Theme::ApplyLsColors(std::string_view ls_colors)
{
    for (const auto& item : StringUtils::Split(ls_colors, ':')) {
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string_view key(item.data(), eq);
        std::string color = ThemeSupport::MakeAnsiFromSgr(std::string_view(item).substr(eq + 1));
        if (key.size() > 2 && key.substr(0, 2) == "*.") {
            colors_.set("*." + StringUtils::ToLower(key.substr(2)), std::move(color));
            continue;
        }
        std::string_view element = ThemeSupport::ElementForLsKey(key);
        if (!element.empty()) {
            colors_.set(std::string(element), std::move(color));
        }
    }
}

std::string Theme::ColorFor(const FileInfo& info) const
{
    if (info.is_broken_symlink) {
        return colors_.get("dead_link");
    }
    switch (info.kind) {
        case EntryKind::Symlink:
            return colors_.get("link");
        case EntryKind::Directory:
            return colors_.get("dir");
        case EntryKind::Socket:
            return colors_.get("socket");
        case EntryKind::Fifo:
            return colors_.get("fifo");
        case EntryKind::BlockDevice:
            return colors_.get("blockdev");
        case EntryKind::CharDevice:
            return colors_.get("chardev");
        case EntryKind::File:
        case EntryKind::Other:
            break;
    }
    if (info.is_exec) {
        return colors_.get("executable_file");
    }
    std::string ext = StringUtils::Extension(info.name);
    if (!ext.empty()) {
        auto it = colors_.values.find("*." + ext);
        if (it != colors_.values.end()) {
            return it->second;
        }
        std::string_view category = ThemeSupport::CategoryFor(ext);
        if (!category.empty()) {
            return colors_.get(category);
        }
    }
    return colors_.get("file");
}

bool Theme::ShouldColorize(Config::ColorMode mode, bool is_terminal, bool no_color_env)
{
    switch (mode) {
        case Config::ColorMode::Always:
            return true;
        case Config::ColorMode::Never:
            return false;
        case Config::ColorMode::Auto:
            break;
    }
    return is_terminal && !no_color_env;
}

std::string Theme::ApplyColor(const std::string& color,
                              std::string_view text,
                              const ThemeColors& theme,
                              bool no_color)
{
    if (no_color || color.empty()) return std::string(text);
    std::string out;
    out.reserve(color.size() + text.size() + theme.reset.size());
    out += color;
    out.append(text.begin(), text.end());
    out += theme.reset;
    return out;
}

} // namespace ntree
