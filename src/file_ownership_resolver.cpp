#include "file_ownership_resolver.h"

#include <utility>

#ifndef _WIN32
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#endif

namespace ntree {

void FileOwnershipResolver::Populate(FileInfo& file_info, bool dereference) {
    file_info.owner.clear();
    file_info.group.clear();
#ifdef _WIN32
    (void)dereference;
#else
    struct stat st {};
    const bool follow = dereference && file_info.is_symlink() && !file_info.is_broken_symlink;
    const int rc = follow ? ::stat(file_info.path.c_str(), &st) : ::lstat(file_info.path.c_str(), &st);
    if (rc != 0) {
        return;
    }

    file_info.owner = OwnerName(static_cast<std::uintmax_t>(st.st_uid));
    file_info.group = GroupName(static_cast<std::uintmax_t>(st.st_gid));

    if (!file_info.has_size) {
        file_info.size = static_cast<std::uintmax_t>(st.st_size);
        file_info.has_size = true;
    }
#endif
}

const std::string& FileOwnershipResolver::OwnerName(std::uintmax_t uid) {
    auto it = owners_.find(uid);
    if (it != owners_.end()) {
        return it->second;
    }
    std::string name = std::to_string(uid);
#ifndef _WIN32
    if (const passwd* pw = ::getpwuid(static_cast<uid_t>(uid))) {
        name = pw->pw_name;
    }
#endif
    return owners_.emplace(uid, std::move(name)).first->second;
}

const std::string& FileOwnershipResolver::GroupName(std::uintmax_t gid) {
    auto it = groups_.find(gid);
    if (it != groups_.end()) {
        return it->second;
    }
    std::string name = std::to_string(gid);
#ifndef _WIN32
    if (const group* gr = ::getgrgid(static_cast<gid_t>(gid))) {
        name = gr->gr_name;
    }
#endif
    return groups_.emplace(gid, std::move(name)).first->second;
}

} // namespace ntree
