#include <gtest/gtest.h>

#include "symlink_resolver.h"
#include "test_support.h"

using ntree::EntryKind;
using ntree::FileInfo;
using ntree::SymlinkResolver;
using ntree::testing::TempDir;
namespace fs = std::filesystem;

namespace {

FileInfo LinkInfo(const fs::path& path) {
    FileInfo info;
    info.path = path;
    info.name = path.filename().string();
    info.kind = EntryKind::Symlink;
    return info;
}

}  // namespace

TEST(SymlinkResolverTest, LinkToDirectoryThroughChain) {
    TempDir dir;
    dir.MakeDir("real");
    dir.Symlink("real", "first");
    // Link text is relative to nested/, where "first" does not exist.
    auto second = dir.Symlink("first", "nested/second");
    auto relative = dir.Symlink("../first", "nested/up");

    SymlinkResolver resolver;
    FileInfo broken = LinkInfo(second);
    resolver.Populate(broken);
    ASSERT_TRUE(broken.has_symlink_target);
    ASSERT_EQ(broken.symlink_target, fs::path("first"));
    ASSERT_TRUE(broken.is_broken_symlink);
    ASSERT_FALSE(broken.is_dir);

    FileInfo live = LinkInfo(relative);
    resolver.Populate(live);
    ASSERT_FALSE(live.is_broken_symlink);
    ASSERT_TRUE(live.is_dir);
    ASSERT_EQ(resolver.RealPath(relative), fs::canonical(dir.path() / "real"));
}

TEST(SymlinkResolverTest, LinkToFile) {
    TempDir dir;
    dir.WriteFile("notes.txt", "x");
    auto link = dir.Symlink("notes.txt", "latest");

    SymlinkResolver resolver;
    FileInfo info = LinkInfo(link);
    resolver.Populate(info);
    ASSERT_FALSE(info.is_broken_symlink);
    ASSERT_FALSE(info.is_dir);
}

TEST(SymlinkResolverTest, IgnoresNonLinks) {
    TempDir dir;
    FileInfo info;
    info.path = dir.MakeDir("plain");
    info.kind = EntryKind::Directory;
    info.is_dir = true;

    SymlinkResolver resolver;
    resolver.Populate(info);
    ASSERT_FALSE(info.has_symlink_target);
    ASSERT_TRUE(info.is_dir);
    ASSERT_FALSE(resolver.RealPath(dir.path() / "missing").has_value());
}
