#include "listing_reader.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

#include "logger.h"
#include "perf.h"
#include "string_utils.h"
#include "time_formatter.h"

namespace ntree {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kTarProbeLines = 5;
constexpr std::size_t kTarMinFields = 6;
constexpr std::array<std::string_view, 4> kTarModePrefixes = {"drwx", "-rw", "lrwx", "-rwx"};

struct TarMode {
    EntryKind kind = EntryKind::File;
    fs::perms perms = fs::perms::none;
};

std::optional<TarMode> ParseTarMode(std::string_view mode) {
    if (mode.size() != 10) {
        return std::nullopt;
    }
    TarMode result;
    switch (mode[0]) {
        case 'd':
            result.kind = EntryKind::Directory;
            break;
        case 'l':
            result.kind = EntryKind::Symlink;
            break;
        case 's':
            result.kind = EntryKind::Socket;
            break;
        case 'p':
            result.kind = EntryKind::Fifo;
            break;
        case 'b':
            result.kind = EntryKind::BlockDevice;
            break;
        case 'c':
            result.kind = EntryKind::CharDevice;
            break;
        case '-':
        case 'h':
            result.kind = EntryKind::File;
            break;
        default:
            return std::nullopt;
    }

    using P = fs::perms;
    constexpr std::array<P, 9> kBits = {
        P::owner_read, P::owner_write, P::owner_exec,
        P::group_read, P::group_write, P::group_exec,
        P::others_read, P::others_write, P::others_exec};
    constexpr std::array<P, 3> kSpecial = {P::set_uid, P::set_gid, P::sticky_bit};
    for (std::size_t i = 0; i < 9; ++i) {
        const char ch = mode[i + 1];
        if (ch == '-') {
            continue;
        }
        if (i % 3 == 2) {
            if (ch == 's' || ch == 't') {
                result.perms |= kBits[i] | kSpecial[i / 3];
            } else if (ch == 'S' || ch == 'T') {
                result.perms |= kSpecial[i / 3];
            } else if (ch == 'x') {
                result.perms |= kBits[i];
            } else {
                return std::nullopt;
            }
        } else {
            result.perms |= kBits[i];
        }
    }
    return result;
}

// Position just past the n-th whitespace separated field, or npos.
std::size_t SkipFields(std::string_view line, std::size_t count) {
    std::size_t i = 0;
    for (std::size_t field = 0; field < count; ++field) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        if (i == line.size()) {
            return std::string_view::npos;
        }
        while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
    }
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return i < line.size() ? i : std::string_view::npos;
}

}  // namespace

ListingReader::ListingReader(std::istream& in, std::string root_label)
    : root_label_(std::move(root_label)) {
    auto& perf_manager = perf::Manager::Instance();
    const bool perf_enabled = perf_manager.enabled();
    std::optional<perf::Timer> timer;
    if (perf_enabled) {
        timer.emplace("listing::parse");
    }

    Node root;
    root.info.path = fs::path(root_label_);
    root.info.name = root_label_;
    root.info.kind = EntryKind::Directory;
    root.info.is_dir = true;
    nodes_.push_back(std::move(root));
    by_path_.emplace(nodes_.front().info.path.generic_string(), 0);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = StringUtils::Trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }
    parse(lines);

    if (perf_enabled) {
        perf_manager.IncrementCounter("listing::lines", lines.size());
        perf_manager.IncrementCounter("listing::nodes", nodes_.size());
    }
}

bool ListingReader::LooksLikeTarListing(const std::vector<std::string>& lines) {
    const std::size_t probe = std::min(lines.size(), kTarProbeLines);
    for (std::size_t i = 0; i < probe; ++i) {
        const std::string& line = lines[i];
        if (StringUtils::SplitWhitespace(line).size() < kTarMinFields) {
            continue;
        }
        for (auto prefix : kTarModePrefixes) {
            if (line.compare(0, prefix.size(), prefix) == 0) {
                return true;
            }
        }
    }
    return false;
}

void ListingReader::parse(const std::vector<std::string>& lines) {
    format_ = LooksLikeTarListing(lines) ? Format::Tar : Format::Simple;
    Logger::instance().debug("listing format: ", format_ == Format::Tar ? "tar" : "simple",
                             ", ", lines.size(), " lines");
    for (const auto& line : lines) {
        if (format_ == Format::Tar && add_tar_line(line)) {
            continue;
        }
        add_simple_line(line);
    }
}

void ListingReader::add_simple_line(std::string_view line) {
    const bool is_dir = !line.empty() && line.back() == '/';
    insert(line, is_dir);
}

bool ListingReader::add_tar_line(std::string_view line) {
    auto fields = StringUtils::SplitWhitespace(line);
    if (fields.size() < kTarMinFields) {
        return false;
    }
    auto mode = ParseTarMode(fields[0]);
    if (!mode) {
        Logger::instance().debug("listing: unrecognized mode '", fields[0], "', reading line as a path");
        return false;
    }
    std::size_t path_start = SkipFields(line, 5);
    if (path_start == std::string_view::npos) {
        return false;
    }

    std::string_view path = line.substr(path_start);
    std::string_view target;
    if (mode->kind == EntryKind::Symlink) {
        auto arrow = path.find(" -> ");
        if (arrow != std::string_view::npos) {
            target = path.substr(arrow + 4);
            path = path.substr(0, arrow);
        }
    } else if (fields[0][0] == 'h') {
        auto link = path.find(" link to ");
        if (link != std::string_view::npos) {
            path = path.substr(0, link);
        }
    }

    const bool is_dir = mode->kind == EntryKind::Directory;
    auto index = insert(path, is_dir);
    if (!index) {
        return true;
    }

    Node& node = nodes_[*index];
    FileInfo& info = node.info;
    if (node.children.empty()) {
        info.kind = mode->kind;
        info.is_dir = is_dir;
    }
    info.perms = mode->perms;
    info.has_perms = true;
    if (info.kind == EntryKind::File) {
        info.is_exec = (mode->perms & (fs::perms::owner_exec | fs::perms::group_exec |
                                       fs::perms::others_exec)) != fs::perms::none;
    }
    if (info.kind == EntryKind::Symlink && !target.empty()) {
        info.symlink_target = fs::path(std::string(target));
        info.has_symlink_target = true;
    }

    const std::string& owner_group = fields[1];
    auto slash = owner_group.find('/');
    info.owner = owner_group.substr(0, slash);
    info.group = slash == std::string::npos ? std::string() : owner_group.substr(slash + 1);

    uintmax_t size = 0;
    const std::string& size_text = fields[2];
    auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size);
    if (ec == std::errc() && ptr == size_text.data() + size_text.size()) {
        info.size = size;
        info.has_size = true;
    }

    if (auto mtime = TimeFormatter::ParseLocal(fields[3], fields[4])) {
        info.mtime = *mtime;
        info.has_mtime = true;
    }
    return true;
}

std::optional<std::size_t> ListingReader::insert(std::string_view relative, bool is_dir) {
    std::vector<std::string> segments;
    for (auto& segment : StringUtils::Split(relative, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        segments.push_back(std::move(segment));
    }
    if (segments.empty()) {
        return std::nullopt;
    }

    std::size_t current = 0;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        if (nodes_[current].info.kind != EntryKind::Directory) {
            promote_to_directory(current);
        }
        current = child_of(current, segments[i]);
        if (last && is_dir && nodes_[current].info.kind != EntryKind::Directory) {
            promote_to_directory(current);
        }
    }
    return current;
}

std::size_t ListingReader::child_of(std::size_t parent, const std::string& name) {
    auto found = nodes_[parent].child_index.find(name);
    if (found != nodes_[parent].child_index.end()) {
        return found->second;
    }

    Node node;
    node.info.path = nodes_[parent].info.path / name;
    node.info.name = name;
    node.info.kind = EntryKind::File;
    const std::size_t index = nodes_.size();
    by_path_.emplace(node.info.path.generic_string(), index);
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(index);
    nodes_[parent].child_index.emplace(name, index);
    return index;
}

void ListingReader::promote_to_directory(std::size_t index) {
    FileInfo& info = nodes_[index].info;
    info.kind = EntryKind::Directory;
    info.is_dir = true;
    info.is_exec = false;
    info.has_symlink_target = false;
    info.symlink_target.clear();
}

std::vector<fs::path> ListingReader::roots() const {
    return {fs::path(root_label_)};
}

std::error_code ListingReader::open_root(const fs::path& root, Entry& out) {
    (void)root;
    out = Entry{};
    out.info = nodes_.front().info;
    out.depth = 0;
    out.is_last = true;
    return {};
}

std::error_code ListingReader::read_children(const Entry& dir, std::vector<Entry>& out) {
    auto found = by_path_.find(dir.info.path.generic_string());
    if (found == by_path_.end()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    const Node& node = nodes_[found->second];
    out.reserve(out.size() + node.children.size());
    for (std::size_t child : node.children) {
        Entry entry{};
        entry.info = nodes_[child].info;
        out.push_back(std::move(entry));
    }
    return {};
}

bool ListingReader::traversable(const Entry& entry) const {
    return entry.info.kind == EntryKind::Directory;
}

std::optional<fs::path> ListingReader::real_path(const Entry& entry) const {
    (void)entry;
    return std::nullopt;
}

}  // namespace ntree
