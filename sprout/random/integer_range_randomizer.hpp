/*
 * integer_range_randomizer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Seeded integer draws from a closed-open range

**************************************************/

#ifndef SPROUT_RANDOM_INTEGER_RANGE_RANDOMIZER_HPP
#define SPROUT_RANDOM_INTEGER_RANGE_RANDOMIZER_HPP

#include <cstdint>
#include <optional>
#include <random>

#include "sprout/utils/random.hpp"

namespace sprout::random {

/**
 * @brief Produces integers in [min, max).
 *
 * With a seed, the sequence of values is fully determined by (min, max,
 * seed). An empty range (min == max) always yields min.
 */
class IntegerRangeRandomizer {
public:
    /**
     * @param min Inclusive lower bound.
     * @param max Exclusive upper bound.
     * @param seed Engine seed, or std::nullopt to seed from
     * std::random_device.
     * @throws InvalidArgument if min > max
     */
    IntegerRangeRandomizer(int min, int max,
                           std::optional<std::int64_t> seed = std::nullopt);

    [[nodiscard]] auto getRandomValue() -> int;

    [[nodiscard]] auto getMin() const noexcept -> int { return min_; }
    [[nodiscard]] auto getMax() const noexcept -> int { return max_; }

private:
    using Engine = utils::Random<std::mt19937_64,
                                 std::uniform_int_distribution<int>>;

    int min_;
    int max_;
    Engine random_;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_INTEGER_RANGE_RANDOMIZER_HPP
