#include <gtest/gtest.h>

#include <cstddef>
#include <random>

#include "sprout/utils/random.hpp"

using namespace sprout::utils;

namespace {
using IndexRandom =
    Random<std::mt19937, std::uniform_int_distribution<std::size_t>>;
}

TEST(RandomTest, SameSeedSameSequence) {
    Random<std::mt19937_64, std::uniform_int_distribution<int>> first(7, 0, 99);
    Random<std::mt19937_64, std::uniform_int_distribution<int>> second(7, 0,
                                                                       99);
    for (int i = 0; i < 20; ++i) {
        int value = first();
        EXPECT_EQ(value, second());
        EXPECT_GE(value, 0);
        EXPECT_LE(value, 99);
    }
}

TEST(RandomTest, OneOffParametersBoundTheDraw) {
    IndexRandom random(3);
    for (int i = 0; i < 200; ++i) {
        auto index = random(IndexRandom::ParamType(2, 4));
        EXPECT_GE(index, 2u);
        EXPECT_LE(index, 4u);
    }
}
