#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <system_error>
#include <type_traits>
#include <vector>

#include "file_info.h"

namespace ntree {

struct Entry {
    FileInfo info;
    // Root is 0, its children 1.
    std::size_t depth = 0;
    bool is_last = false;
};

enum class VisitResult {
    Ok = 0,
    Minor = 1,
    Serious = 2,
};

class VisitResultAggregator {
public:
    [[nodiscard]] static constexpr VisitResult Combine(VisitResult a, VisitResult b) noexcept {
        using Underlying = std::underlying_type_t<VisitResult>;
        const auto lhs = static_cast<Underlying>(a);
        const auto rhs = static_cast<Underlying>(b);
        return static_cast<VisitResult>(std::max(lhs, rhs));
    }
};

// Where the hierarchy comes from. FileScanner reads the real filesystem,
// ListingReader reconstructs one from a flat list of paths.
class PathSource {
public:
    virtual ~PathSource() = default;

    // Top-level locations in the order they should be rendered.
    [[nodiscard]] virtual std::vector<std::filesystem::path> roots() const = 0;

    // Fills `out` for a root location; the root keeps the label it was given.
    [[nodiscard]] virtual std::error_code open_root(const std::filesystem::path& root, Entry& out) = 0;

    // Raw, unfiltered and unsorted direct children of `dir`.
    [[nodiscard]] virtual std::error_code read_children(const Entry& dir, std::vector<Entry>& out) = 0;

    // Whether the walk may descend into `entry`.
    [[nodiscard]] virtual bool traversable(const Entry& entry) const = 0;

    // Canonical location used for cycle detection, when the source has one.
    [[nodiscard]] virtual std::optional<std::filesystem::path> real_path(const Entry& entry) const = 0;
};

}  // namespace ntree
