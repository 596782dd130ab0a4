#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "sprout/error/exception.hpp"

using namespace sprout::error;

TEST(ExceptionTest, MessageConcatenatesArguments) {
    try {
        THROW_INVALID_ARGUMENT("pool size ", 0, " is below ", 1);
    } catch (const InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "pool size 0 is below 1");
        EXPECT_GT(e.getLine(), 0);
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
        return;
    }
    FAIL() << "InvalidArgument was not thrown";
}

TEST(ExceptionTest, WhatIncludesThrowSite) {
    try {
        THROW_OUT_OF_RANGE("no pooled instance");
    } catch (const Exception& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("Message: no pooled instance"), std::string::npos);
        EXPECT_NE(what.find("test_exception.cpp"), std::string::npos);
        EXPECT_NE(what.find("Function: "), std::string::npos);
        return;
    }
    FAIL() << "OutOfRange was not thrown";
}

TEST(ExceptionTest, HierarchyIsCatchableAsStdException) {
    EXPECT_THROW(THROW_OUT_OF_RANGE("boom"), std::exception);
    EXPECT_THROW(THROW_FAIL_TO_OPEN_FILE("missing"), Exception);
}
