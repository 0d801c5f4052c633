#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "entry_filter.h"
#include "test_support.h"

using ntree::Entry;
using ntree::EntryFilter;
using ntree::testing::MakeEntry;

namespace {

std::vector<std::string> Names(const std::vector<Entry>& entries) {
    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.info.name);
    }
    return names;
}

}  // namespace

TEST(EntryFilterTest, HidesDotEntriesUnlessAll) {
    std::vector<Entry> entries{MakeEntry("."), MakeEntry(".."), MakeEntry(".git", true), MakeEntry("src", true)};

    EntryFilter hidden(EntryFilter::Options{});
    auto visible = entries;
    hidden.Apply(visible);
    ASSERT_EQ(Names(visible), (std::vector<std::string>{"src"}));

    EntryFilter all(EntryFilter::Options{.show_hidden = true});
    auto everything = entries;
    all.Apply(everything);
    ASSERT_EQ(Names(everything), (std::vector<std::string>{".git", "src"}));
}

TEST(EntryFilterTest, IncludeAndExcludeCombine) {
    std::vector<Entry> entries{MakeEntry("a.txt"), MakeEntry("b.txt"), MakeEntry("c.log")};
    EntryFilter filter(EntryFilter::Options{.include_pattern = "*.txt", .exclude_pattern = "b*"});
    filter.Apply(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"a.txt"}));
}

TEST(EntryFilterTest, IncludePatternSkipsDirectoriesUnlessMatchDirs) {
    Entry dir = MakeEntry("docs", true);
    EntryFilter files_only(EntryFilter::Options{.include_pattern = "*.md"});
    ASSERT_TRUE(files_only.Accepts(dir));

    EntryFilter with_dirs(EntryFilter::Options{.match_dirs = true, .include_pattern = "*.md"});
    ASSERT_FALSE(with_dirs.Accepts(dir));
    ASSERT_TRUE(with_dirs.Accepts(MakeEntry("notes.md", true)));
}

TEST(EntryFilterTest, ExcludeAppliesToDirectories) {
    EntryFilter filter(EntryFilter::Options{.exclude_pattern = "build|node_modules"});
    ASSERT_FALSE(filter.Accepts(MakeEntry("build", true)));
    ASSERT_FALSE(filter.Accepts(MakeEntry("node_modules", true)));
    ASSERT_TRUE(filter.Accepts(MakeEntry("src", true)));
}

TEST(EntryFilterTest, DirsOnlyDropsFiles) {
    std::vector<Entry> entries{MakeEntry("a", true), MakeEntry("b.txt"), MakeEntry("c", true)};
    EntryFilter filter(EntryFilter::Options{.dirs_only = true});
    filter.Apply(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"a", "c"}));
}

TEST(EntryFilterTest, LimitIsExceededOnlyAboveTheBound) {
    EntryFilter unlimited(EntryFilter::Options{});
    ASSERT_FALSE(unlimited.ExceedsLimit(100000));

    EntryFilter limited(EntryFilter::Options{.file_limit = 2});
    ASSERT_FALSE(limited.ExceedsLimit(2));
    ASSERT_TRUE(limited.ExceedsLimit(3));

    EntryFilter zero(EntryFilter::Options{.file_limit = 0});
    ASSERT_FALSE(zero.ExceedsLimit(0));
    ASSERT_TRUE(zero.ExceedsLimit(1));
}
