#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "sprout/error/exception.hpp"
#include "sprout/random/integer_range_randomizer.hpp"

using namespace sprout::random;

TEST(IntegerRangeRandomizerTest, ValuesStayInClosedOpenRange) {
    IntegerRangeRandomizer randomizer(3, 7, 42);
    std::set<int> seen;
    for (int i = 0; i < 1000; ++i) {
        int value = randomizer.getRandomValue();
        EXPECT_GE(value, 3);
        EXPECT_LT(value, 7);
        seen.insert(value);
    }
    EXPECT_EQ(seen, (std::set<int>{3, 4, 5, 6}));
}

TEST(IntegerRangeRandomizerTest, SameSeedSameSequence) {
    IntegerRangeRandomizer first(0, 1000, 123);
    IntegerRangeRandomizer second(0, 1000, 123);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(first.getRandomValue(), second.getRandomValue());
    }
}

TEST(IntegerRangeRandomizerTest, DifferentSeedsDiverge) {
    IntegerRangeRandomizer first(0, 1000000, 1);
    IntegerRangeRandomizer second(0, 1000000, 2);
    std::vector<int> a;
    std::vector<int> b;
    for (int i = 0; i < 10; ++i) {
        a.push_back(first.getRandomValue());
        b.push_back(second.getRandomValue());
    }
    EXPECT_NE(a, b);
}

TEST(IntegerRangeRandomizerTest, EmptyRangeYieldsMin) {
    IntegerRangeRandomizer randomizer(5, 5, 7);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(randomizer.getRandomValue(), 5);
    }
}

TEST(IntegerRangeRandomizerTest, SingleValueRange) {
    IntegerRangeRandomizer randomizer(5, 6);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(randomizer.getRandomValue(), 5);
    }
}

TEST(IntegerRangeRandomizerTest, InvertedRangeThrows) {
    EXPECT_THROW(IntegerRangeRandomizer(6, 5, 1),
                 sprout::error::InvalidArgument);
}

TEST(IntegerRangeRandomizerTest, NegativeBounds) {
    IntegerRangeRandomizer randomizer(-4, -1, 9);
    EXPECT_EQ(randomizer.getMin(), -4);
    EXPECT_EQ(randomizer.getMax(), -1);
    for (int i = 0; i < 100; ++i) {
        int value = randomizer.getRandomValue();
        EXPECT_GE(value, -4);
        EXPECT_LT(value, -1);
    }
}
