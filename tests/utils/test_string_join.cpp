#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sprout/utils/string.hpp"

using namespace sprout::utils;

TEST(StringUtilsTest, JoinStrings) {
    std::vector<std::string> parts{"order", "item", "price"};
    EXPECT_EQ(joinStrings(parts, "."), "order.item.price");
    EXPECT_EQ(joinStrings(std::vector<std::string>{"single"}, "."), "single");
    EXPECT_EQ(joinStrings(std::vector<std::string>{}, "."), "");
    EXPECT_EQ(joinStrings(std::vector<std::string>{"a", "", "b"}, "::"),
              "a::::b");
}

TEST(StringUtilsTest, ToLower) {
    EXPECT_EQ(toLower("OrderItem"), "orderitem");
    EXPECT_EQ(toLower("price_2"), "price_2");
    EXPECT_EQ(toLower(""), "");
}
