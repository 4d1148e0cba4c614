#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace retrier {

constexpr char KEY_VALUE_DELIMITER = '=';
constexpr char COMMENT_PREFIX = '#';

inline std::string ToUpper(std::string_view str) {
    std::string upper(str);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char cha) { return std::toupper(cha); });
    return upper;
}

// Strips leading and trailing whitespace.
inline std::string TrimCopy(std::string_view str_view) {
    size_t begin = 0;
    size_t end = str_view.size();
    while (begin < end && (std::isspace(static_cast<unsigned char>(str_view[begin])) != 0)) {
        ++begin;
    }
    while (end > begin && (std::isspace(static_cast<unsigned char>(str_view[end - 1])) != 0)) {
        --end;
    }
    return std::string(str_view.substr(begin, end - begin));
}

} // namespace retrier
