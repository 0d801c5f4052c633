#include "path_processor.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <utility>

#include "logger.h"
#include "perf.h"

namespace ntree {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRecursiveAnnotation = "[recursive, not followed]";
constexpr const char* kErrorAnnotation = "[error opening dir]";

std::string LimitAnnotation(std::size_t count) {
    std::ostringstream text;
    text << '[' << count << " entries exceeds filelimit, not opening dir]";
    return text.str();
}

}  // namespace

PathProcessor::PathProcessor(const Config& config,
                             PathSource& source,
                             Renderer& renderer,
                             std::ostream& err)
    : config_(config),
      source_(source),
      renderer_(renderer),
      err_(err),
      filter_(config),
      sorter_(config) {}

VisitResult PathProcessor::process(const fs::path& root) {
    auto& perf_manager = perf::Manager::Instance();
    const bool perf_enabled = perf_manager.enabled();
    std::optional<perf::Timer> timer;
    if (perf_enabled) {
        timer.emplace("processor::process");
    }

    Entry root_entry;
    if (auto ec = source_.open_root(root, root_entry)) {
        reportError(root, ec);
        return VisitResult::Serious;
    }

    guard_ = CycleGuard{};
    branches_.clear();

    // A root that names a directory through a symlink is listed regardless of
    // the follow setting.
    if (!source_.traversable(root_entry) && !root_entry.info.is_dir) {
        renderer_.RenderRoot(root_entry);
        return VisitResult::Ok;
    }

    VisitResult status = VisitResult::Ok;
    bool root_guarded = false;
    if (auto real = guardPath(root_entry)) {
        root_guarded = guard_.Enter(std::move(*real));
    }

    Listing root_listing = readListing(root_entry, VisitResult::Serious, status);
    renderer_.RenderRoot(root_entry, root_listing.annotation);

    std::vector<Frame> stack;
    stack.push_back(Frame{std::move(root_listing.children), 0, root_guarded});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        if (frame.next >= frame.children.size()) {
            if (frame.guarded) {
                guard_.Leave();
            }
            stack.pop_back();
            if (!stack.empty()) {
                branches_.pop_back();
            }
            continue;
        }

        Entry entry = std::move(frame.children[frame.next++]);
        summary_.Count(entry);

        if (!shouldDescend(entry)) {
            renderer_.RenderEntry(entry, branches_);
            continue;
        }

        bool guarded = false;
        if (auto real = guardPath(entry)) {
            if (guard_.Contains(*real)) {
                Logger::instance().debug("not following ", entry.info.path.string(),
                                         ": already visited as ", real->string());
                renderer_.RenderEntry(entry, branches_, kRecursiveAnnotation);
                continue;
            }
            guarded = guard_.Enter(std::move(*real));
        }

        Listing listing = readListing(entry, VisitResult::Minor, status);
        renderer_.RenderEntry(entry, branches_, listing.annotation);
        if (listing.children.empty()) {
            if (guarded) {
                guard_.Leave();
            }
            continue;
        }
        // `frame` may dangle after the push below.
        branches_.push_back(!entry.is_last);
        stack.push_back(Frame{std::move(listing.children), 0, guarded});
    }

    return status;
}

PathProcessor::Listing PathProcessor::readListing(const Entry& dir,
                                                  VisitResult severity,
                                                  VisitResult& status) {
    Listing listing;
    std::vector<Entry> children;
    if (auto ec = source_.read_children(dir, children)) {
        reportError(dir.info.path, ec);
        listing.annotation = kErrorAnnotation;
        status = VisitResultAggregator::Combine(status, severity);
        return listing;
    }

    filter_.Apply(children);
    if (filter_.ExceedsLimit(children.size())) {
        listing.annotation = LimitAnnotation(children.size());
        return listing;
    }

    for (auto& child : children) {
        child.depth = dir.depth + 1;
    }
    if (config_.prune()) {
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [this](const Entry& child) { return !keepAfterPrune(child); }),
                       children.end());
    }
    sorter_.Sort(children);
    for (std::size_t i = 0; i < children.size(); ++i) {
        children[i].is_last = i + 1 == children.size();
    }
    listing.children = std::move(children);
    return listing;
}

bool PathProcessor::shouldDescend(const Entry& entry) const {
    if (!source_.traversable(entry)) {
        return false;
    }
    const auto& max_depth = config_.max_depth();
    return !max_depth || entry.depth < *max_depth;
}

std::optional<fs::path> PathProcessor::guardPath(const Entry& entry) const {
    if (!config_.follow_symlinks()) {
        return std::nullopt;
    }
    return source_.real_path(entry);
}

bool PathProcessor::keepAfterPrune(const Entry& entry) {
    if (!entry.info.is_dir) {
        return true;
    }
    if (!source_.traversable(entry)) {
        // A directory symlink that is not followed still renders as a leaf.
        return true;
    }
    if (!shouldDescend(entry)) {
        return false;
    }
    return hasVisibleContent(entry);
}

bool PathProcessor::hasVisibleContent(const Entry& dir) {
    auto& perf_manager = perf::Manager::Instance();
    if (perf_manager.enabled()) {
        perf_manager.IncrementCounter("prune::probes");
    }

    // Real paths of the directories on the current descent, one slot per level
    // (empty when links are not followed), and the depth each target was first
    // explored at. A target explored at the same or a shallower depth without
    // turning up anything visible has nothing to add.
    std::vector<fs::path> chain;
    std::map<fs::path, std::size_t> explored;
    if (auto real = guardPath(dir)) {
        if (guard_.Contains(*real)) {
            return true;
        }
        explored.emplace(*real, dir.depth);
    }

    struct Pending {
        Entry entry;
        std::size_t chain_depth = 0;
    };
    std::vector<Pending> pending;
    pending.push_back(Pending{dir, 0});
    while (!pending.empty()) {
        Pending item = std::move(pending.back());
        pending.pop_back();
        Entry& current = item.entry;
        chain.resize(item.chain_depth);
        chain.push_back(guardPath(current).value_or(fs::path{}));

        std::vector<Entry> children;
        if (source_.read_children(current, children)) {
            // Rendered with an error annotation.
            return true;
        }
        filter_.Apply(children);
        if (filter_.ExceedsLimit(children.size())) {
            return true;
        }
        for (auto& child : children) {
            child.depth = current.depth + 1;
            if (!child.info.is_dir || !source_.traversable(child)) {
                return true;
            }
            if (!shouldDescend(child)) {
                continue;
            }
            if (auto real = guardPath(child)) {
                if (guard_.Contains(*real) ||
                    std::find(chain.begin(), chain.end(), *real) != chain.end()) {
                    // Rendered as a recursive link.
                    return true;
                }
                auto [it, inserted] = explored.emplace(*real, child.depth);
                if (!inserted) {
                    if (it->second <= child.depth) {
                        continue;
                    }
                    it->second = child.depth;
                }
            }
            pending.push_back(Pending{std::move(child), chain.size()});
        }
    }
    return false;
}

void PathProcessor::reportError(const fs::path& path, const std::error_code& ec) {
    err_ << "ntree: " << path.string() << ": " << ec.message() << '\n';
}

}  // namespace ntree
