#pragma once

#include <filesystem>
#include <string>

#include "file_info.h"

namespace ntree {

class PermissionFormatter {
public:
    static constexpr std::size_t kWidth = 10;

    // ls-style mode string, e.g. "drwxr-xr-x". Empty when the entry has no
    // permission bits.
    std::string Format(const FileInfo& info) const;

    static char TypeSymbol(EntryKind kind);

private:
    static char SymbolForPermissions(bool read,
                                     bool write,
                                     bool execute,
                                     std::filesystem::perms special,
                                     std::filesystem::perms mask,
                                     char special_char_lower,
                                     char special_char_upper);
};

}  // namespace ntree
