#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

namespace ntree {

// Real paths of the directories on the current descent, root first.
class CycleGuard {
public:
    [[nodiscard]] bool Contains(const std::filesystem::path& real_path) const;

    // Returns false, leaving the chain untouched, if the path is already on it.
    bool Enter(std::filesystem::path real_path);
    void Leave();

    [[nodiscard]] std::size_t depth() const noexcept { return chain_.size(); }
    [[nodiscard]] bool empty() const noexcept { return chain_.empty(); }

private:
    std::vector<std::filesystem::path> chain_;
};

} // namespace ntree
