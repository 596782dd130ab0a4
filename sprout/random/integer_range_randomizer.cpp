/*
 * integer_range_randomizer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Seeded integer draws from a closed-open range

**************************************************/

#include "integer_range_randomizer.hpp"

#include "sprout/error/exception.hpp"

namespace sprout::random {

namespace {
auto checkedUpperBound(int min, int max) -> int {
    if (min > max) {
        THROW_INVALID_ARGUMENT("max (", max, ") must be greater than min (",
                               min, ")");
    }
    return min == max ? max : max - 1;
}

auto engineSeed(std::optional<std::int64_t> seed) -> std::uint64_t {
    if (seed) {
        return static_cast<std::uint64_t>(*seed);
    }
    return std::random_device{}();
}
}  // namespace

IntegerRangeRandomizer::IntegerRangeRandomizer(int min, int max,
                                               std::optional<std::int64_t> seed)
    : min_(min),
      max_(max),
      random_(engineSeed(seed), min, checkedUpperBound(min, max)) {}

auto IntegerRangeRandomizer::getRandomValue() -> int { return random_(); }

}  // namespace sprout::random
