#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ntree {

class StringUtils {
public:
    static constexpr bool IsHidden(std::string_view name) noexcept
    {
        return !name.empty() && name.front() == '.';
    }

    static constexpr bool IsDotOrDotDot(std::string_view name) noexcept
    {
        return name == "." || name == "..";
    }

    static std::string ToLower(std::string_view value);
    static std::string Trim(std::string_view value);

    // Splits on every occurrence of the separator; empty fields are kept.
    static std::vector<std::string> Split(std::string_view value, char separator);
    // Splits on runs of whitespace; empty fields are dropped.
    static std::vector<std::string> SplitWhitespace(std::string_view value);

    static std::string Extension(std::string_view name);

private:
    static constexpr unsigned char ascii_to_lower(unsigned char ch) noexcept
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<unsigned char>(ch - 'A' + 'a') : ch;
    }
};

} // namespace ntree
