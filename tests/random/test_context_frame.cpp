#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "sprout/random/context_frame.hpp"

using namespace sprout::random;

namespace {

struct Owner {};
struct Child {};

TEST(ContextFrameTest, KeepsObjectAndField) {
    auto owner = std::make_shared<Owner>();
    ContextFrame frame(owner, Field::of<Child>("child"));

    EXPECT_EQ(frame.getObject(), owner);
    EXPECT_EQ(frame.getField().name, "child");
    EXPECT_EQ(frame.getField().type, typeOf<Child>());
}

TEST(ContextFrameTest, UnknownTypeHasNoUsedObject) {
    ContextFrame frame(std::make_shared<Owner>(), Field::of<Child>("child"));
    EXPECT_EQ(frame.getUsedObject(typeOf<Child>()), nullptr);
}

TEST(ContextFrameTest, LatestUsageWins) {
    ContextFrame frame(std::make_shared<Owner>(), Field::of<Child>("child"));
    auto first = std::make_shared<Child>();
    auto second = std::make_shared<Child>();

    frame.registerUsage(typeOf<Child>(), first);
    EXPECT_EQ(frame.getUsedObject(typeOf<Child>()), first);

    frame.registerUsage(typeOf<Child>(), second);
    EXPECT_EQ(frame.getUsedObject(typeOf<Child>()), second);
}

TEST(ContextFrameTest, UsagesAreKeyedByType) {
    ContextFrame frame(std::make_shared<Owner>(), Field::of<Child>("child"));
    auto owner = std::make_shared<Owner>();
    auto child = std::make_shared<Child>();

    frame.registerUsage(typeOf<Owner>(), owner);
    frame.registerUsage(typeOf<Child>(), child);

    EXPECT_EQ(frame.getUsedObject(typeOf<Owner>()), owner);
    EXPECT_EQ(frame.getUsedObject(typeOf<Child>()), child);
    EXPECT_EQ(frame.getUsedObject(typeOf<int>()), nullptr);
}

}  // namespace
