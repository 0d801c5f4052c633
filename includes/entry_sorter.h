#pragma once

#include <string_view>
#include <vector>

#include "config.h"
#include "path_source.h"

namespace ntree {

class EntrySorter {
public:
    struct Options {
        Config::Sort key = Config::Sort::Name;
        bool reverse = false;
        bool dirs_first = false;
    };

    explicit EntrySorter(Options options);
    explicit EntrySorter(const Config& config);

    void Sort(std::vector<Entry>& entries) const;

    // Three-way natural comparison: digit runs compare by numeric value.
    [[nodiscard]] static int CompareVersion(std::string_view a, std::string_view b);

private:
    Options options_;
};

}  // namespace ntree
