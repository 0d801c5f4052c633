#pragma once

#include <cstddef>

#include "path_source.h"

namespace ntree {

// Running directory/file totals over every emitted non-root entry.
struct Summary {
    std::size_t directories = 0;
    std::size_t files = 0;

    void Count(const Entry& entry) noexcept {
        if (entry.info.is_dir) {
            ++directories;
        } else {
            ++files;
        }
    }
};

}  // namespace ntree
