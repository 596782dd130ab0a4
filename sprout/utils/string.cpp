/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: String helpers used to build field paths

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>

namespace sprout::utils {

auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string {
    if (strings.empty()) {
        return {};
    }

    size_t totalSize = delimiter.size() * (strings.size() - 1);
    for (const auto& str : strings) {
        totalSize += str.size();
    }

    std::string result;
    result.reserve(totalSize);
    result.append(strings.front());
    for (size_t i = 1; i < strings.size(); ++i) {
        result.append(delimiter);
        result.append(strings[i]);
    }
    return result;
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace sprout::utils
