#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace ntree {

std::string StringUtils::ToLower(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(StringUtils::ascii_to_lower(ch));
    });
    return result;
}

std::string StringUtils::Trim(std::string_view value)
{
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), [&](char ch) {
        return is_space(static_cast<unsigned char>(ch));
    });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [&](char ch) {
        return is_space(static_cast<unsigned char>(ch));
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::vector<std::string> StringUtils::Split(std::string_view value, char separator)
{
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = value.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(value.substr(start));
            break;
        }
        parts.emplace_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> StringUtils::SplitWhitespace(std::string_view value)
{
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        std::size_t start = i;
        while (i < value.size() && !std::isspace(static_cast<unsigned char>(value[i]))) ++i;
        if (i > start) {
            parts.emplace_back(value.substr(start, i - start));
        }
    }
    return parts;
}

std::string StringUtils::Extension(std::string_view name)
{
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= name.size()) {
        return {};
    }
    return ToLower(name.substr(dot + 1));
}

} // namespace ntree
