#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "config.h"
#include "path_source.h"

namespace ntree {

class FileOwnershipResolver;
class SymlinkResolver;

// Path source over the real filesystem. Never throws; every failure comes
// back as an error_code for the caller to report.
class FileScanner : public PathSource {
public:
    FileScanner(const Config& config,
                FileOwnershipResolver& ownership_resolver,
                SymlinkResolver& symlink_resolver);

    [[nodiscard]] std::vector<std::filesystem::path> roots() const override;
    [[nodiscard]] std::error_code open_root(const std::filesystem::path& root, Entry& out) override;
    [[nodiscard]] std::error_code read_children(const Entry& dir, std::vector<Entry>& out) override;
    [[nodiscard]] bool traversable(const Entry& entry) const override;
    [[nodiscard]] std::optional<std::filesystem::path> real_path(const Entry& entry) const override;

private:
    void populate_entry(const std::filesystem::directory_entry& de, Entry& entry) const;
    [[nodiscard]] bool needs_ownership() const;

    const Config& config_;
    FileOwnershipResolver& ownership_resolver_;
    SymlinkResolver& symlink_resolver_;
};

}  // namespace ntree
