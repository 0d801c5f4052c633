#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ntree {

// Shell-style name matching: `*`, `?`, `[...]`, `[!...]`/`[^...]` with `-`
// ranges, `\` escapes, and `|` separating top-level alternatives.
class WildcardMatcher final {
public:
    explicit WildcardMatcher(std::string_view pattern);

    [[nodiscard]] bool Matches(std::string_view text) const;
    [[nodiscard]] const std::vector<std::string>& alternatives() const noexcept { return alternatives_; }

    [[nodiscard]] static bool MatchesSingle(std::string_view pattern, std::string_view text);
    [[nodiscard]] static std::vector<std::string> SplitAlternatives(std::string_view pattern);

private:
    [[nodiscard]] static bool MatchCharClass(std::string_view pattern, size_t& idx, char ch, bool& matched);

    std::vector<std::string> alternatives_;
};

}  // namespace ntree
