/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: String helpers used to build field paths

**************************************************/

#ifndef SPROUT_UTILS_STRING_HPP
#define SPROUT_UTILS_STRING_HPP

#include <span>
#include <string>
#include <string_view>

namespace sprout::utils {

/**
 * @brief Concatenates strings with a delimiter between consecutive items.
 *
 * @param strings The strings to concatenate.
 * @param delimiter The delimiter to insert.
 * @return The concatenated string, empty when @p strings is empty.
 */
[[nodiscard("the result of joinStrings is not used")]]
auto joinStrings(std::span<const std::string> strings,
                 std::string_view delimiter) -> std::string;

/**
 * @brief ASCII lower-casing.
 */
[[nodiscard]] auto toLower(std::string_view str) -> std::string;

}  // namespace sprout::utils

#endif  // SPROUT_UTILS_STRING_HPP
