#include "wildcard_matcher.h"

namespace ntree {

WildcardMatcher::WildcardMatcher(std::string_view pattern)
    : alternatives_(SplitAlternatives(pattern)) {}

bool WildcardMatcher::Matches(std::string_view text) const {
    for (const auto& alternative : alternatives_) {
        if (MatchesSingle(alternative, text)) return true;
    }
    return false;
}

std::vector<std::string> WildcardMatcher::SplitAlternatives(std::string_view pattern) {
    std::vector<std::string> out;
    std::string current;
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char ch = pattern[i];
        if (ch == '\\' && i + 1 < pattern.size()) {
            current.push_back(ch);
            current.push_back(pattern[++i]);
            continue;
        }
        if (in_class) {
            if (ch == ']') in_class = false;
            current.push_back(ch);
            continue;
        }
        if (ch == '[') {
            in_class = true;
        } else if (ch == '|') {
            out.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    out.push_back(std::move(current));
    return out;
}

bool WildcardMatcher::MatchesSingle(std::string_view pattern, std::string_view text) {
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t match = 0;
    while (t < text.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '*') {
                star = ++p;
                match = t;
                continue;
            }
            bool literal = true;
            if (pc == '[') {
                size_t idx = p + 1;
                bool matched = false;
                if (MatchCharClass(pattern, idx, text[t], matched)) {
                    literal = false;
                    if (matched) {
                        p = idx;
                        ++t;
                        continue;
                    }
                }
            }
            if (literal) {
                if (pc == '\\' && p + 1 < pattern.size()) {
                    ++p;
                    pc = pattern[p];
                }
                if (pc == text[t]) {
                    ++p;
                    ++t;
                    continue;
                }
            }
        }
        if (star != std::string_view::npos) {
            p = star;
            ++match;
            t = match;
            continue;
        }
        return false;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// Returns false when the class is unterminated, in which case `[` is literal.
bool WildcardMatcher::MatchCharClass(std::string_view pattern, size_t& idx, char ch, bool& matched) {
    size_t start = idx;
    if (idx >= pattern.size()) return false;
    bool negated = false;
    if (pattern[idx] == '!' || pattern[idx] == '^') {
        negated = true;
        ++idx;
    }
    matched = false;
    while (idx < pattern.size() && pattern[idx] != ']') {
        char start_char = pattern[idx];
        if (start_char == '\\' && idx + 1 < pattern.size()) {
            ++idx;
            start_char = pattern[idx];
        }
        ++idx;
        if (idx < pattern.size() && pattern[idx] == '-' && idx + 1 < pattern.size() && pattern[idx + 1] != ']') {
            ++idx;
            char end_char = pattern[idx];
            if (end_char == '\\' && idx + 1 < pattern.size()) {
                ++idx;
                end_char = pattern[idx];
            }
            if (start_char <= ch && ch <= end_char) {
                matched = true;
            }
            ++idx;
        } else {
            if (ch == start_char) matched = true;
        }
    }
    if (idx < pattern.size() && pattern[idx] == ']') {
        ++idx;
        if (negated) matched = !matched;
        return true;
    }
    idx = start;
    matched = false;
    return false;
}

}  // namespace ntree
