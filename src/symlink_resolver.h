#pragma once

#include <filesystem>
#include <optional>

#include "file_info.h"

namespace ntree {

class SymlinkResolver {
public:
    // For a symlink entry: records the link text and whether the final
    // target is missing or a directory. Other entries are left alone.
    void Populate(FileInfo& file_info) const;

    // Canonical path with every link resolved, or nullopt if it cannot be
    // resolved (dangling link, permission problem).
    std::optional<std::filesystem::path> RealPath(const std::filesystem::path& path) const;
};

} // namespace ntree
