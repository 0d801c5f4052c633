#include "entry_filter.h"

#include <algorithm>
#include <utility>

#include "string_utils.h"

namespace ntree {

EntryFilter::EntryFilter(Options options)
    : options_(std::move(options))
{
    if (options_.include_pattern) {
        include_.emplace(*options_.include_pattern);
    }
    if (options_.exclude_pattern) {
        exclude_.emplace(*options_.exclude_pattern);
    }
}

EntryFilter::EntryFilter(const Config& config)
    : EntryFilter(Options{
          .show_hidden = config.all(),
          .dirs_only = config.dirs_only(),
          .match_dirs = config.match_dirs(),
          .include_pattern = config.include_pattern(),
          .exclude_pattern = config.exclude_pattern(),
          .file_limit = config.file_limit(),
      }) {}

bool EntryFilter::Accepts(const Entry& entry) const {
    const std::string& name = entry.info.name;
    if (StringUtils::IsDotOrDotDot(name)) {
        return false;
    }
    if (!options_.show_hidden && StringUtils::IsHidden(name)) {
        return false;
    }

    // Directories stay reachable so that matching files below them still show.
    if (include_ && (!entry.info.is_dir || options_.match_dirs) && !include_->Matches(name)) {
        return false;
    }
    if (exclude_ && exclude_->Matches(name)) {
        return false;
    }

    if (options_.dirs_only && !entry.info.is_dir) {
        return false;
    }
    return true;
}

void EntryFilter::Apply(std::vector<Entry>& entries) const {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [this](const Entry& entry) { return !Accepts(entry); }),
                  entries.end());
}

bool EntryFilter::ExceedsLimit(std::size_t filtered_count) const noexcept {
    return options_.file_limit && filtered_count > *options_.file_limit;
}

}  // namespace ntree
