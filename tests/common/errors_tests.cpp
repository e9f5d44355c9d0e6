/**
 * @file errors_tests.cpp
 * Unit tests for argsem::AfError
 */
#include <gtest/gtest.h>
#include "argsem/common/errors.hpp"

#include <string>

using namespace argsem;

TEST(AfErrorTests, Code_IsPreserved)
{
    AfError e(AfErrorCode::ParseError, "line 3: bad record");
    EXPECT_EQ(e.code(), AfErrorCode::ParseError);
    EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
}

TEST(AfErrorTests, Code_HasName)
{
    EXPECT_STREQ(to_string(AfErrorCode::DuplicateArgument), "DuplicateArgument");
    EXPECT_STREQ(to_string(AfErrorCode::SearchExhausted), "SearchExhausted");
}

TEST(AfErrorTests, CatchAsStdException)
{
    try
    {
        throw AfError(AfErrorCode::InvalidRequest, "bad");
    }
    catch (const std::exception& e)
    {
        EXPECT_STREQ(e.what(), "bad");
    }
}
