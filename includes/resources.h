#pragma once

#include <filesystem>
#include <vector>

namespace ntree {

// Search path for the configuration database, most specific first:
// $NTREE_DATA_DIR, the working directory, the executable's directory and its
// parent, then /etc/ntree and ~/.ntree (%APPDATA%\ntree on Windows).
class ResourceLocator {
public:
    static constexpr const char* kDatabaseFilename = "ntree.sqlite3";
    static constexpr const char* kDataDirVariable = "NTREE_DATA_DIR";

    // `argv0` may be null.
    explicit ResourceLocator(const char* argv0);

    [[nodiscard]] const std::vector<std::filesystem::path>& directories() const noexcept { return directories_; }

    // Database files that exist, in search order. The $NTREE_DATA_DIR entry
    // is kept even when missing so that a bad override shows up in the log.
    [[nodiscard]] std::vector<std::filesystem::path> databaseCandidates() const;

private:
    void addDirectory(const std::filesystem::path& dir);

    std::vector<std::filesystem::path> directories_;
    std::filesystem::path override_dir_;
};

} // namespace ntree
