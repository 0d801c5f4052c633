#include "entry_sorter.h"

#include <algorithm>
#include <cctype>

namespace ntree {

namespace {

bool IsDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

EntrySorter::EntrySorter(Options options)
    : options_(options) {}

EntrySorter::EntrySorter(const Config& config)
    : EntrySorter(Options{
          .key = config.sort(),
          .reverse = config.reverse(),
          .dirs_first = config.dirs_first(),
      }) {}

int EntrySorter::CompareVersion(std::string_view a, std::string_view b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (IsDigit(a[i]) && IsDigit(b[j])) {
            size_t a_start = i;
            size_t b_start = j;
            while (a_start < a.size() && a[a_start] == '0') ++a_start;
            while (b_start < b.size() && b[b_start] == '0') ++b_start;
            size_t a_end = a_start;
            size_t b_end = b_start;
            while (a_end < a.size() && IsDigit(a[a_end])) ++a_end;
            while (b_end < b.size() && IsDigit(b[b_end])) ++b_end;

            size_t a_len = a_end - a_start;
            size_t b_len = b_end - b_start;
            if (a_len != b_len) {
                return a_len < b_len ? -1 : 1;
            }
            int cmp = a.substr(a_start, a_len).compare(b.substr(b_start, b_len));
            if (cmp != 0) {
                return cmp < 0 ? -1 : 1;
            }
            // Equal value: the run with fewer leading zeros goes first.
            size_t a_run = a_end - i;
            size_t b_run = b_end - j;
            if (a_run != b_run) {
                return a_run < b_run ? -1 : 1;
            }
            i = a_end;
            j = b_end;
            continue;
        }
        if (a[i] != b[j]) {
            return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]) ? -1 : 1;
        }
        ++i;
        ++j;
    }
    if (i == a.size() && j == b.size()) return 0;
    return i == a.size() ? -1 : 1;
}

void EntrySorter::Sort(std::vector<Entry>& entries) const {
    auto cmp_name = [](const Entry& a, const Entry& b) {
        return a.info.name < b.info.name;
    };
    auto cmp_time = [](const Entry& a, const Entry& b) {
        if (a.info.mtime != b.info.mtime) return a.info.mtime < b.info.mtime;
        return a.info.name < b.info.name;
    };
    auto cmp_version = [](const Entry& a, const Entry& b) {
        int cmp = CompareVersion(a.info.name, b.info.name);
        if (cmp != 0) return cmp < 0;
        return a.info.name < b.info.name;
    };

    switch (options_.key) {
        case Config::Sort::Time: std::stable_sort(entries.begin(), entries.end(), cmp_time); break;
        case Config::Sort::Version: std::stable_sort(entries.begin(), entries.end(), cmp_version); break;
        case Config::Sort::Name: default: std::stable_sort(entries.begin(), entries.end(), cmp_name); break;
    }
    if (options_.reverse) std::reverse(entries.begin(), entries.end());

    if (options_.dirs_first) {
        std::stable_partition(entries.begin(), entries.end(), [](const Entry& e) {
            return e.info.is_dir;
        });
    }
}

}  // namespace ntree
