#include "permission_formatter.h"

#include <array>

namespace ntree {

char PermissionFormatter::SymbolForPermissions(bool read,
                                               bool write,
                                               bool execute,
                                               std::filesystem::perms special,
                                               std::filesystem::perms mask,
                                               char special_char_lower,
                                               char special_char_upper) {
    if ((special & mask) != std::filesystem::perms::none) {
        if (execute) {
            return special_char_lower;
        }
        if (read || write) {
            return special_char_upper;
        }
    }
    return execute ? 'x' : '-';
}

char PermissionFormatter::TypeSymbol(EntryKind kind) {
    switch (kind) {
        case EntryKind::Directory:
            return 'd';
        case EntryKind::Symlink:
            return 'l';
        case EntryKind::Socket:
            return 's';
        case EntryKind::Fifo:
            return 'p';
        case EntryKind::BlockDevice:
            return 'b';
        case EntryKind::CharDevice:
            return 'c';
        case EntryKind::File:
        case EntryKind::Other:
            break;
    }
    return '-';
}

std::string PermissionFormatter::Format(const FileInfo& info) const {
    if (!info.has_perms) {
        return {};
    }

    using std::filesystem::perms;
    const perms permissions = info.perms;
    auto has = [&](perms mask) {
        return (permissions & mask) != perms::none;
    };

    const std::array<bool, 3> can_read = {
        has(perms::owner_read), has(perms::group_read), has(perms::others_read)};
    const std::array<bool, 3> can_write = {
        has(perms::owner_write), has(perms::group_write), has(perms::others_write)};
    const std::array<bool, 3> can_exec = {
        has(perms::owner_exec), has(perms::group_exec), has(perms::others_exec)};
    const std::array<perms, 3> special_masks = {
        perms::set_uid, perms::set_gid, perms::sticky_bit};

    std::string result;
    result.reserve(kWidth);
    result.push_back(TypeSymbol(info.kind));
    for (std::size_t i = 0; i < 3; ++i) {
        result.push_back(can_read[i] ? 'r' : '-');
        result.push_back(can_write[i] ? 'w' : '-');
        const char lower = i == 2 ? 't' : 's';
        const char upper = i == 2 ? 'T' : 'S';
        result.push_back(SymbolForPermissions(can_read[i], can_write[i], can_exec[i],
                                              permissions, special_masks[i], lower, upper));
    }
    return result;
}

}  // namespace ntree
