#include <gtest/gtest.h>

#include <vector>

#include "sprout/random/size_driven_populator.hpp"

using namespace sprout::random;

namespace {

// Minimal collection populator: fills a vector with as many zeros as the
// drawn size.
class ZeroVectorPopulator : public SizeDrivenPopulator {
public:
    using SizeDrivenPopulator::SizeDrivenPopulator;

    auto populate() -> std::vector<int> {
        return std::vector<int>(static_cast<size_t>(getRandomSize()), 0);
    }
};

}  // namespace

TEST(SizeDrivenPopulatorTest, SizesFollowConfiguredRange) {
    GenerationParameters parameters;
    parameters.setCollectionSizeRange(2, 5);
    ZeroVectorPopulator populator(parameters);
    for (int i = 0; i < 200; ++i) {
        auto size = populator.populate().size();
        EXPECT_GE(size, 2u);
        EXPECT_LT(size, 5u);
    }
}

TEST(SizeDrivenPopulatorTest, SeededParametersReproduceSizes) {
    GenerationParameters parameters;
    parameters.setCollectionSizeRange(0, 50).setSeed(2024);
    ZeroVectorPopulator first(parameters);
    ZeroVectorPopulator second(parameters);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(first.populate().size(), second.populate().size());
    }
}

TEST(SizeDrivenPopulatorTest, FixedSizeRange) {
    GenerationParameters parameters;
    parameters.setCollectionSizeRange(3, 3).setSeed(std::nullopt);
    ZeroVectorPopulator populator(parameters);
    EXPECT_EQ(populator.populate().size(), 3u);
}
