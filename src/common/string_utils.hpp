/*
 * string_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Small string helpers shared by the output parsers

**************************************************/

#ifndef DEVPREVIEW_COMMON_STRING_UTILS_HPP
#define DEVPREVIEW_COMMON_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace devpreview::utils {

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

[[nodiscard]] inline auto toLower(std::string_view s) -> std::string {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b)
    -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}

/**
 * @brief Split text into lines, dropping the trailing '\r' of CRLF endings
 */
[[nodiscard]] inline auto splitLines(std::string_view text)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        auto line = text.substr(
            start, end == std::string_view::npos ? std::string_view::npos
                                                 : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

[[nodiscard]] inline auto split(std::string_view text, char delimiter)
    -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

}  // namespace devpreview::utils

#endif  // DEVPREVIEW_COMMON_STRING_UTILS_HPP
