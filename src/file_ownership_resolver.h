#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "file_info.h"

namespace ntree {

// Owner and group names for -u/-g, cached per id for the whole walk.
class FileOwnershipResolver {
public:
    // Fills ids and names from stat(2), or lstat(2) unless `dereference` and
    // the entry is a live symlink. Unknown ids print as numbers. Leaves the
    // fields unset when the stat fails. A size the caller could not read is
    // taken from the same stat.
    void Populate(FileInfo& file_info, bool dereference);

private:
    const std::string& OwnerName(std::uintmax_t uid);
    const std::string& GroupName(std::uintmax_t gid);

    std::unordered_map<std::uintmax_t, std::string> owners_;
    std::unordered_map<std::uintmax_t, std::string> groups_;
};

} // namespace ntree
