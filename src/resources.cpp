#include "resources.h"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <system_error>

#include "logger.h"
#include "perf.h"

namespace ntree {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> EnvDirectory(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

fs::path Normalize(const fs::path& dir) {
    std::error_code ec;
    fs::path normalized = fs::weakly_canonical(dir, ec);
    return ec ? dir.lexically_normal() : normalized;
}

} // namespace

ResourceLocator::ResourceLocator(const char* argv0) {
    auto& perf_manager = perf::Manager::Instance();
    std::optional<perf::Timer> timer;
    if (perf_manager.enabled()) {
        timer.emplace("resources::locate");
    }

    if (auto env = EnvDirectory(kDataDirVariable)) {
        override_dir_ = Normalize(*env);
        addDirectory(override_dir_);
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        addDirectory(cwd);
    }

    if (argv0 != nullptr && argv0[0] != '\0') {
        fs::path exe(argv0);
        if (exe.has_parent_path()) {
            if (exe.is_relative() && !cwd.empty()) {
                exe = cwd / exe;
            }
            const fs::path exe_dir = Normalize(exe).parent_path();
            addDirectory(exe_dir);
            addDirectory(exe_dir.parent_path());
        }
    }

#ifdef _WIN32
    if (auto appdata = EnvDirectory("APPDATA")) {
        addDirectory(*appdata / "ntree");
    }
#else
    addDirectory("/etc/ntree");
    if (auto home = EnvDirectory("HOME")) {
        addDirectory(*home / ".ntree");
    }
#endif

    Logger::instance().debug("database search path has ", directories_.size(), " directories");
}

void ResourceLocator::addDirectory(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    fs::path normalized = Normalize(dir);
    if (std::find(directories_.begin(), directories_.end(), normalized) == directories_.end()) {
        directories_.push_back(std::move(normalized));
    }
}

std::vector<fs::path> ResourceLocator::databaseCandidates() const {
    std::vector<fs::path> candidates;
    for (const auto& dir : directories_) {
        fs::path candidate = dir / kDatabaseFilename;
        std::error_code ec;
        const bool exists = fs::is_regular_file(candidate, ec) && !ec;
        if (exists || (!override_dir_.empty() && dir == override_dir_)) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

} // namespace ntree
