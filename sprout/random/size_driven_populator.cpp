/*
 * size_driven_populator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Base for populators that need a collection or array size

**************************************************/

#include "size_driven_populator.hpp"

namespace sprout::random {

SizeDrivenPopulator::SizeDrivenPopulator(
    const GenerationParameters& parameters)
    : sizeRandomizer_(parameters.getCollectionSizeRange().min,
                      parameters.getCollectionSizeRange().max,
                      parameters.getSeed()) {}

auto SizeDrivenPopulator::getRandomSize() -> int {
    return sizeRandomizer_.getRandomValue();
}

}  // namespace sprout::random
