#include "symlink_resolver.h"

#include <system_error>
#include <utility>

namespace ntree {

namespace fs = std::filesystem;

void SymlinkResolver::Populate(FileInfo& file_info) const {
    if (!file_info.is_symlink()) {
        return;
    }

    std::error_code ec;
    fs::path target = fs::read_symlink(file_info.path, ec);
    if (!ec) {
        file_info.symlink_target = std::move(target);
        file_info.has_symlink_target = true;
    }

    ec.clear();
    const fs::file_status status = fs::status(file_info.path, ec);
    file_info.is_broken_symlink = ec || !fs::exists(status);
    file_info.is_dir = !file_info.is_broken_symlink && fs::is_directory(status);
}

std::optional<fs::path> SymlinkResolver::RealPath(const fs::path& path) const {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return canonical;
}

} // namespace ntree
