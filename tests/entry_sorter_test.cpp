#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "entry_sorter.h"
#include "test_support.h"

using ntree::Config;
using ntree::Entry;
using ntree::EntrySorter;
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

TEST(EntrySorterTest, NameOrderIsByteWise) {
    std::vector<Entry> entries{MakeEntry("beta"), MakeEntry("Zeta"), MakeEntry("alpha")};
    EntrySorter(EntrySorter::Options{}).Sort(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"Zeta", "alpha", "beta"}));
}

TEST(EntrySorterTest, TimeOrderIsOldestFirstWithNameTieBreak) {
    const auto base = std::chrono::system_clock::now();
    std::vector<Entry> entries{MakeEntry("new"), MakeEntry("old"), MakeEntry("b-same"), MakeEntry("a-same")};
    entries[0].info.mtime = base + std::chrono::hours(2);
    entries[1].info.mtime = base;
    entries[2].info.mtime = base + std::chrono::hours(1);
    entries[3].info.mtime = base + std::chrono::hours(1);

    EntrySorter(EntrySorter::Options{.key = Config::Sort::Time}).Sort(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"old", "a-same", "b-same", "new"}));
}

TEST(EntrySorterTest, VersionOrderComparesDigitRunsNumerically) {
    std::vector<Entry> entries{MakeEntry("file10"), MakeEntry("file2"), MakeEntry("file1"), MakeEntry("file01")};
    EntrySorter(EntrySorter::Options{.key = Config::Sort::Version}).Sort(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"file1", "file01", "file2", "file10"}));
}

TEST(EntrySorterTest, CompareVersionIsThreeWay) {
    ASSERT_LT(EntrySorter::CompareVersion("v1.9", "v1.10"), 0);
    ASSERT_GT(EntrySorter::CompareVersion("v2.0", "v1.10"), 0);
    ASSERT_EQ(EntrySorter::CompareVersion("abc", "abc"), 0);
    ASSERT_LT(EntrySorter::CompareVersion("abc", "abcd"), 0);
}

TEST(EntrySorterTest, ReverseTwiceRestoresOrder) {
    std::vector<Entry> entries{MakeEntry("c"), MakeEntry("a"), MakeEntry("b")};
    auto sorted = entries;
    EntrySorter(EntrySorter::Options{}).Sort(sorted);

    auto reversed = entries;
    EntrySorter(EntrySorter::Options{.reverse = true}).Sort(reversed);
    ASSERT_EQ(Names(reversed), (std::vector<std::string>{"c", "b", "a"}));

    std::reverse(reversed.begin(), reversed.end());
    ASSERT_EQ(Names(reversed), Names(sorted));
}

TEST(EntrySorterTest, DirsFirstAppliesAfterReverse) {
    std::vector<Entry> entries{MakeEntry("a.txt"), MakeEntry("lib", true), MakeEntry("z.txt"), MakeEntry("bin", true)};
    EntrySorter(EntrySorter::Options{.reverse = true, .dirs_first = true}).Sort(entries);
    ASSERT_EQ(Names(entries), (std::vector<std::string>{"lib", "bin", "z.txt", "a.txt"}));
}
