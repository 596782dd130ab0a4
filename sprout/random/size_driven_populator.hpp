/*
 * size_driven_populator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Base for populators that need a collection or array size

**************************************************/

#ifndef SPROUT_RANDOM_SIZE_DRIVEN_POPULATOR_HPP
#define SPROUT_RANDOM_SIZE_DRIVEN_POPULATOR_HPP

#include "sprout/random/integer_range_randomizer.hpp"
#include "sprout/random/parameters.hpp"

namespace sprout::random {

/**
 * @brief Draws sizes from the configured collection size range, seeded with
 * the configured seed, so that collection and array populators built from
 * the same parameters size their output identically.
 */
class SizeDrivenPopulator {
public:
    explicit SizeDrivenPopulator(const GenerationParameters& parameters);
    virtual ~SizeDrivenPopulator() = default;

protected:
    [[nodiscard]] auto getRandomSize() -> int;

private:
    IntegerRangeRandomizer sizeRandomizer_;
};

}  // namespace sprout::random

#endif  // SPROUT_RANDOM_SIZE_DRIVEN_POPULATOR_HPP
