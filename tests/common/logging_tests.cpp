/**
 * @file logging_tests.cpp
 * Unit tests for the argsem logger
 */
#include <gtest/gtest.h>
#include "argsem/common/logging.hpp"

using namespace argsem;

TEST(LoggingTests, Logger_IsSharedAndNamed)
{
    auto a = logger();
    auto b = logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), k_logger_name);
    EXPECT_EQ(spdlog::get(k_logger_name), a);
}

TEST(LoggingTests, SetLevel_AppliesToLogger)
{
    set_log_level(spdlog::level::debug);
    EXPECT_TRUE(logger()->should_log(spdlog::level::debug));
    set_log_level(spdlog::level::warn);
    EXPECT_FALSE(logger()->should_log(spdlog::level::info));
}
