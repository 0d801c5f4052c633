#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

#include "config.h"
#include "cycle_guard.h"
#include "entry_filter.h"
#include "entry_sorter.h"
#include "path_source.h"
#include "renderer.h"
#include "summary.h"

namespace ntree {

// Walks one root at a time, depth-first, with an explicit stack of sibling
// lists. Path errors are reported to `err` as "ntree: <path>: <reason>".
class PathProcessor {
public:
    PathProcessor(const Config& config,
                  PathSource& source,
                  Renderer& renderer,
                  std::ostream& err);

    [[nodiscard]] VisitResult process(const std::filesystem::path& root);

    // Totals over every root processed so far.
    [[nodiscard]] const Summary& summary() const noexcept { return summary_; }

private:
    struct Frame {
        std::vector<Entry> children;
        std::size_t next = 0;
        // The directory owning this frame holds a cycle guard slot.
        bool guarded = false;
    };

    struct Listing {
        std::vector<Entry> children;
        std::string annotation;
    };

    // Reads, filters, prunes, sorts and marks the children of `dir`.
    [[nodiscard]] Listing readListing(const Entry& dir, VisitResult severity, VisitResult& status);
    [[nodiscard]] bool shouldDescend(const Entry& entry) const;
    [[nodiscard]] bool keepAfterPrune(const Entry& entry);
    [[nodiscard]] bool hasVisibleContent(const Entry& dir);
    [[nodiscard]] std::optional<std::filesystem::path> guardPath(const Entry& entry) const;
    void reportError(const std::filesystem::path& path, const std::error_code& ec);

    const Config& config_;
    PathSource& source_;
    Renderer& renderer_;
    std::ostream& err_;
    EntryFilter filter_;
    EntrySorter sorter_;
    CycleGuard guard_;
    // branches_[i] is true when the ancestor at depth i + 1 has following siblings.
    std::vector<bool> branches_;
    Summary summary_;
};

}  // namespace ntree
