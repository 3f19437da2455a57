#pragma once

#include <range/v3/algorithm/equal.hpp>

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace exegrader {

/// ASCII whitespace, including the file, group, record and unit separators (0x1c - 0x1f)
inline constexpr std::string_view WHITESPACE_CHARS = " \t\n\v\f\r\x1c\x1d\x1e\x1f";

/// Remove leading and trailing whitespace (see WHITESPACE_CHARS)
constexpr std::string_view trim(std::string_view str) {
    const auto first = str.find_first_not_of(WHITESPACE_CHARS);

    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = str.find_last_not_of(WHITESPACE_CHARS);

    return str.substr(first, last - first + 1);
}

/// Translate "\r\n" and any lone '\r' to '\n'
inline std::string normalize_newlines(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '\r') {
            result.push_back(str[i]);
            continue;
        }

        result.push_back('\n');
        if (i + 1 < str.size() && str[i + 1] == '\n') {
            ++i;
        }
    }

    return result;
}

inline char to_lower(char chr) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
}

inline bool iequals(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(lhs, rhs, [](char a, char b) { return to_lower(a) == to_lower(b); });
}

} // namespace exegrader
