#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "path_source.h"
#include "wildcard_matcher.h"

namespace ntree {

class EntryFilter {
public:
    struct Options {
        bool show_hidden = false;
        bool dirs_only = false;
        bool match_dirs = false;
        std::optional<std::string> include_pattern;
        std::optional<std::string> exclude_pattern;
        std::optional<std::size_t> file_limit;
    };

    explicit EntryFilter(Options options);
    explicit EntryFilter(const Config& config);

    [[nodiscard]] bool Accepts(const Entry& entry) const;

    // Removes rejected entries in place, keeping the order of the rest.
    void Apply(std::vector<Entry>& entries) const;

    [[nodiscard]] bool ExceedsLimit(std::size_t filtered_count) const noexcept;

private:
    Options options_;
    std::optional<WildcardMatcher> include_;
    std::optional<WildcardMatcher> exclude_;
};

}  // namespace ntree
