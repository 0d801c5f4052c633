#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <unistd.h>

#include "file_ownership_resolver.h"
#include "fs_scanner.h"
#include "listing_reader.h"
#include "path_processor.h"
#include "renderer.h"
#include "symlink_resolver.h"
#include "test_support.h"
#include "theme.h"

using ntree::Config;
using ntree::FileOwnershipResolver;
using ntree::FileScanner;
using ntree::ListingReader;
using ntree::PathProcessor;
using ntree::PathSource;
using ntree::Renderer;
using ntree::Summary;
using ntree::SymlinkResolver;
using ntree::Theme;
using ntree::VisitResult;
using ntree::testing::TempDir;
namespace fs = std::filesystem;

namespace {

struct TreeRun {
    VisitResult status = VisitResult::Ok;
    std::string out;
    std::string err;
    Summary summary;
};

TreeRun RunOver(const Config& config, PathSource& source, const std::vector<fs::path>& roots) {
    Theme theme;
    std::ostringstream out;
    std::ostringstream err;
    Renderer renderer(config, theme, out);
    PathProcessor processor(config, source, renderer, err);

    TreeRun run;
    for (const auto& root : roots) {
        run.status = ntree::VisitResultAggregator::Combine(run.status, processor.process(root));
    }
    run.out = out.str();
    run.err = err.str();
    run.summary = processor.summary();
    return run;
}

TreeRun RunTree(const Config& config, const fs::path& root) {
    FileOwnershipResolver ownership;
    SymlinkResolver symlinks;
    FileScanner scanner(config, ownership, symlinks);
    return RunOver(config, scanner, {root});
}

// Output below the root line, which carries the temporary directory name.
std::string Body(const std::string& out) {
    auto newline = out.find('\n');
    return newline == std::string::npos ? std::string() : out.substr(newline + 1);
}

}  // namespace

TEST(PathProcessorTest, RendersNestedTree) {
    TempDir dir;
    dir.WriteFile("a/c.txt", "c");
    dir.WriteFile("b.txt", "b");

    TreeRun run = RunTree(Config{}, dir.path());
    ASSERT_EQ(run.status, VisitResult::Ok);
    ASSERT_EQ(run.out, dir.path().string() + "\n"
                       "├── a\n"
                       "│   └── c.txt\n"
                       "└── b.txt\n");
    ASSERT_EQ(run.summary.directories, 1u);
    ASSERT_EQ(run.summary.files, 2u);
    ASSERT_TRUE(run.err.empty());
}

TEST(PathProcessorTest, LevelLimitStopsDescent) {
    TempDir dir;
    dir.WriteFile("a/c.txt");
    dir.WriteFile("b.txt");

    Config config;
    config.set_max_depth(1);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "├── a\n└── b.txt\n");
    ASSERT_EQ(run.summary.directories, 1u);
    ASSERT_EQ(run.summary.files, 1u);
}

TEST(PathProcessorTest, FileLimitAnnotatesCrowdedDirectory) {
    TempDir dir;
    dir.WriteFile("big/1");
    dir.WriteFile("big/2");
    dir.WriteFile("big/3");
    dir.WriteFile("small.txt");

    Config config;
    config.set_file_limit(2);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out),
              "├── big [3 entries exceeds filelimit, not opening dir]\n"
              "└── small.txt\n");
    ASSERT_EQ(run.status, VisitResult::Ok);
}

TEST(PathProcessorTest, FileLimitAppliesToRoot) {
    TempDir dir;
    dir.WriteFile("one");
    dir.WriteFile("two");

    Config config;
    config.set_file_limit(1);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(run.out, dir.path().string() + " [2 entries exceeds filelimit, not opening dir]\n");
    ASSERT_EQ(run.summary.files, 0u);
}

TEST(PathProcessorTest, FollowedSymlinkCycleIsNotEntered) {
    TempDir dir;
    dir.MakeDir("sub");
    dir.Symlink("..", "sub/up");

    Config config;
    config.set_follow_symlinks(true);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "└── sub\n    └── up -> .. [recursive, not followed]\n");
    ASSERT_EQ(run.summary.directories, 2u);
    ASSERT_EQ(run.summary.files, 0u);
}

TEST(PathProcessorTest, UnfollowedDirectorySymlinkIsALeaf) {
    TempDir dir;
    dir.WriteFile("real/inner.txt");
    dir.Symlink("real", "alias");

    TreeRun run = RunTree(Config{}, dir.path());
    ASSERT_EQ(Body(run.out), "├── alias -> real\n└── real\n    └── inner.txt\n");
    ASSERT_EQ(run.summary.directories, 2u);
    ASSERT_EQ(run.summary.files, 1u);
}

TEST(PathProcessorTest, SymlinkRootIsListedWithoutTarget) {
    TempDir dir;
    dir.WriteFile("real/inner.txt");
    auto alias = dir.Symlink("real", "alias");

    TreeRun run = RunTree(Config{}, alias);
    ASSERT_EQ(run.out, alias.string() + "\n└── inner.txt\n");
}

TEST(PathProcessorTest, FileRootPrintsOnlyItsName) {
    TempDir dir;
    auto file = dir.WriteFile("lonely.txt");

    TreeRun run = RunTree(Config{}, file);
    ASSERT_EQ(run.status, VisitResult::Ok);
    ASSERT_EQ(run.out, file.string() + "\n");
    ASSERT_EQ(run.summary.files, 0u);
}

TEST(PathProcessorTest, PruneDropsEmptyBranches) {
    TempDir dir;
    dir.MakeDir("empty");
    dir.MakeDir("nested/deeper");
    dir.WriteFile("keep/x.txt");

    Config config;
    config.set_prune(true);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "└── keep\n    └── x.txt\n");
    ASSERT_EQ(run.summary.directories, 1u);
    ASSERT_EQ(run.summary.files, 1u);
}

TEST(PathProcessorTest, PruneHonorsPatternBelowDirectories) {
    TempDir dir;
    dir.WriteFile("docs/readme.md");
    dir.WriteFile("src/main.cpp");

    Config config;
    config.set_prune(true);
    config.set_include_pattern(std::string("*.cpp"));
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "└── src\n    └── main.cpp\n");
}

TEST(PathProcessorTest, PruneDropsDirectoryWhoseLinksShareAnEmptyTarget) {
    TempDir dir;
    dir.MakeDir("T/E");
    dir.MakeDir("x");
    dir.Symlink("../T", "x/l1");
    dir.Symlink("../T", "x/l2");

    Config config;
    config.set_follow_symlinks(true);
    config.set_prune(true);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "");
    ASSERT_EQ(run.summary.directories, 0u);
    ASSERT_EQ(run.summary.files, 0u);
}

TEST(PathProcessorTest, PruneKeepsBranchEndingInRecursiveLink) {
    TempDir dir;
    dir.MakeDir("sub");
    dir.Symlink("..", "sub/up");

    Config config;
    config.set_follow_symlinks(true);
    config.set_prune(true);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "└── sub\n    └── up -> .. [recursive, not followed]\n");
}

TEST(PathProcessorTest, DirsOnlyAndReverse) {
    TempDir dir;
    dir.MakeDir("alpha");
    dir.MakeDir("beta");
    dir.WriteFile("file.txt");

    Config config;
    config.set_dirs_only(true);
    config.set_reverse(true);
    TreeRun run = RunTree(config, dir.path());
    ASSERT_EQ(Body(run.out), "├── beta\n└── alpha\n");
    ASSERT_EQ(run.summary.directories, 2u);
}

TEST(PathProcessorTest, MissingRootIsSerious) {
    TempDir dir;
    auto missing = dir.path() / "nope";

    TreeRun run = RunTree(Config{}, missing);
    ASSERT_EQ(run.status, VisitResult::Serious);
    ASSERT_TRUE(run.out.empty());
    ASSERT_EQ(run.err.rfind("ntree: " + missing.string() + ": ", 0), 0u);
}

TEST(PathProcessorTest, UnreadableDirectoryIsMinor) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not restrict root";
    }
    TempDir dir;
    auto locked = dir.MakeDir("locked");
    dir.WriteFile("locked/secret");
    dir.WriteFile("open.txt");
    fs::permissions(locked, fs::perms::none);

    TreeRun run = RunTree(Config{}, dir.path());
    fs::permissions(locked, fs::perms::owner_all);

    ASSERT_EQ(run.status, VisitResult::Minor);
    ASSERT_EQ(Body(run.out), "├── locked [error opening dir]\n└── open.txt\n");
    ASSERT_NE(run.err.find("ntree: " + locked.string() + ": "), std::string::npos);
}

TEST(PathProcessorTest, WalksReconstructedListing) {
    std::istringstream in("a/c.txt\nb.txt\n");
    ListingReader reader(in, ".");

    Config config;
    TreeRun run = RunOver(config, reader, reader.roots());
    ASSERT_EQ(run.out, ".\n├── a\n│   └── c.txt\n└── b.txt\n");
    ASSERT_EQ(run.summary.directories, 1u);
    ASSERT_EQ(run.summary.files, 2u);
}

TEST(PathProcessorTest, ListingWithFullPaths) {
    std::istringstream in("a/c.txt\n");
    ListingReader reader(in, "list");

    Config config;
    config.set_full_path(true);
    TreeRun run = RunOver(config, reader, reader.roots());
    ASSERT_EQ(run.out, "list\nlist/a\nlist/a/c.txt\n");
}

TEST(PathProcessorTest, SummaryAccumulatesAcrossRoots) {
    TempDir first;
    first.WriteFile("x/y.txt");
    TempDir second;
    second.WriteFile("z.txt");

    FileOwnershipResolver ownership;
    SymlinkResolver symlinks;
    Config config;
    FileScanner scanner(config, ownership, symlinks);
    TreeRun run = RunOver(config, scanner, {first.path(), second.path()});
    ASSERT_EQ(run.summary.directories, 1u);
    ASSERT_EQ(run.summary.files, 2u);
    ASSERT_EQ(run.status, VisitResult::Ok);
}
