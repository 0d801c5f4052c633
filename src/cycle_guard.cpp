#include "cycle_guard.h"

#include <algorithm>
#include <utility>

namespace ntree {

bool CycleGuard::Contains(const std::filesystem::path& real_path) const {
    return std::find(chain_.begin(), chain_.end(), real_path) != chain_.end();
}

bool CycleGuard::Enter(std::filesystem::path real_path) {
    if (Contains(real_path)) {
        return false;
    }
    chain_.push_back(std::move(real_path));
    return true;
}

void CycleGuard::Leave() {
    if (!chain_.empty()) {
        chain_.pop_back();
    }
}

} // namespace ntree
