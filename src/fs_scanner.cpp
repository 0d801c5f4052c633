#include "fs_scanner.h"

#include <optional>
#include <system_error>
#include <utility>

#include "file_ownership_resolver.h"
#include "perf.h"
#include "string_utils.h"
#include "symlink_resolver.h"
#include "time_formatter.h"

namespace ntree {

namespace fs = std::filesystem;

namespace {

EntryKind KindFromStatus(const fs::file_status& status) {
    switch (status.type()) {
        case fs::file_type::directory:
            return EntryKind::Directory;
        case fs::file_type::symlink:
            return EntryKind::Symlink;
        case fs::file_type::socket:
            return EntryKind::Socket;
        case fs::file_type::fifo:
            return EntryKind::Fifo;
        case fs::file_type::block:
            return EntryKind::BlockDevice;
        case fs::file_type::character:
            return EntryKind::CharDevice;
        case fs::file_type::regular:
            return EntryKind::File;
        default:
            return EntryKind::Other;
    }
}

class ExecutableClassifier final {
public:
    [[nodiscard]] static bool IsExecutable(const fs::path& path, fs::perms perm) {
#ifdef _WIN32
        (void)perm;
        std::string ext = StringUtils::Extension(path.filename().string());
        return (ext == "exe" || ext == "bat" || ext == "cmd" || ext == "ps1");
#else
        (void)path;
        return ((perm & fs::perms::owner_exec) != fs::perms::none ||
                (perm & fs::perms::group_exec) != fs::perms::none ||
                (perm & fs::perms::others_exec) != fs::perms::none);
#endif
    }
};

}  // namespace

FileScanner::FileScanner(const Config& config,
                         FileOwnershipResolver& ownership_resolver,
                         SymlinkResolver& symlink_resolver)
    : config_(config),
      ownership_resolver_(ownership_resolver),
      symlink_resolver_(symlink_resolver) {}

std::vector<fs::path> FileScanner::roots() const {
    std::vector<fs::path> out;
    out.reserve(config_.paths().size());
    for (const auto& path : config_.paths()) {
        out.emplace_back(path);
    }
    if (out.empty()) {
        out.emplace_back(".");
    }
    return out;
}

bool FileScanner::needs_ownership() const {
    return config_.show_owner() || config_.show_group() || config_.size_mode() != Config::SizeMode::Off;
}

std::error_code FileScanner::open_root(const fs::path& root, Entry& out) {
    std::error_code ec;
    auto status = fs::symlink_status(root, ec);
    if (ec) {
        return ec;
    }
    if (!fs::exists(status)) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    fs::directory_entry de(root, ec);
    if (ec) {
        return ec;
    }
    out = Entry{};
    out.info.name = root.string();
    populate_entry(de, out);
    out.depth = 0;
    out.is_last = true;
    return {};
}

std::error_code FileScanner::read_children(const Entry& dir, std::vector<Entry>& out) {
    auto& perf_manager = perf::Manager::Instance();
    const bool perf_enabled = perf_manager.enabled();
    std::optional<perf::Timer> timer;
    if (perf_enabled) {
        timer.emplace("fs::read_children");
        perf_manager.IncrementCounter("fs::directories_read");
    }

    std::error_code ec;
    fs::directory_iterator it(dir.info.path, ec);
    if (ec) {
        return ec;
    }

    fs::directory_iterator end;
    while (it != end) {
        Entry entry{};
        entry.info.name = it->path().filename().string();
        populate_entry(*it, entry);
        out.push_back(std::move(entry));
        it.increment(ec);
        if (ec) {
            // The caller drops the partial listing and annotates the whole
            // directory as unreadable.
            return ec;
        }
    }
    if (perf_enabled) {
        perf_manager.IncrementCounter("fs::entries_read", out.size());
    }
    return {};
}

bool FileScanner::traversable(const Entry& entry) const {
    if (entry.info.kind == EntryKind::Directory) {
        return true;
    }
    return entry.info.is_symlink() && entry.info.is_dir && config_.follow_symlinks();
}

std::optional<fs::path> FileScanner::real_path(const Entry& entry) const {
    return symlink_resolver_.RealPath(entry.info.path);
}

void FileScanner::populate_entry(const fs::directory_entry& de, Entry& entry) const {
    entry.info.path = de.path();

    std::error_code info_ec;
    auto status = de.symlink_status(info_ec);
    if (!info_ec) {
        entry.info.kind = KindFromStatus(status);
        entry.info.perms = status.permissions();
        entry.info.has_perms = entry.info.perms != fs::perms::unknown;
    } else {
        entry.info.kind = EntryKind::Other;
    }
    info_ec.clear();

    entry.info.is_dir = entry.info.kind == EntryKind::Directory;
    if (entry.info.kind == EntryKind::File) {
        entry.info.is_exec = ExecutableClassifier::IsExecutable(entry.info.path, entry.info.perms);
        auto size = de.file_size(info_ec);
        if (!info_ec) {
            entry.info.size = size;
            entry.info.has_size = true;
        }
        info_ec.clear();
    }

    auto mtime = de.last_write_time(info_ec);
    if (!info_ec) {
        entry.info.mtime = TimeFormatter::ToSystemTime(mtime);
        entry.info.has_mtime = true;
    }

    symlink_resolver_.Populate(entry.info);
    if (needs_ownership()) {
        ownership_resolver_.Populate(entry.info, config_.follow_symlinks());
    }
}

}  // namespace ntree
