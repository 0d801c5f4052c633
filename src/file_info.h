#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ntree {

enum class EntryKind {
    File,
    Directory,
    Symlink,
    Socket,
    Fifo,
    BlockDevice,
    CharDevice,
    Other
};

// Everything known about one node. Metadata fields come with a has_* flag so
// that "unknown" is never confused with zero.
class FileInfo {
public:
    FileInfo() = default;

    std::filesystem::path path;
    std::string name;
    EntryKind kind = EntryKind::File;
    // A directory, or a symlink whose target is a directory.
    bool is_dir = false;
    bool is_exec = false;
    bool is_broken_symlink = false;
    uintmax_t size = 0;
    bool has_size = false;
    std::chrono::system_clock::time_point mtime{};
    bool has_mtime = false;
    std::filesystem::perms perms = std::filesystem::perms::none;
    bool has_perms = false;
    std::filesystem::path symlink_target;
    bool has_symlink_target = false;
    std::string owner;
    std::string group;

    bool is_symlink() const { return kind == EntryKind::Symlink; }
};

} // namespace ntree
