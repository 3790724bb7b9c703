#include <gtest/gtest.h>

#include "safe_parse.hpp"

#include <string>

using alignkit::util::removeBom;
using alignkit::util::safeFloat;
using alignkit::util::safeInt;

TEST(SafeParse, ParsesFloats)
{
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("1.25")), 1.25);
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("  -3e2 \n")), -300.0);
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("7")), 7.0);
}

TEST(SafeParse, FloatFallsBackToDefault)
{
    EXPECT_FALSE(safeFloat(std::nullopt).has_value());
    EXPECT_FALSE(safeFloat(std::string("")).has_value());
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("abc"), 0.5), 0.5);
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("1.5s"), 2.0), 2.0);
    EXPECT_DOUBLE_EQ(*safeFloat(std::string("0x10"), 3.0), 3.0);
    EXPECT_DOUBLE_EQ(*safeFloat(std::nullopt, 4.0), 4.0);
}

TEST(SafeParse, IntTruncatesTowardZero)
{
    EXPECT_EQ(*safeInt(std::string("12")), 12);
    EXPECT_EQ(*safeInt(std::string("12.9")), 12);
    EXPECT_EQ(*safeInt(std::string("-12.9")), -12);
}

TEST(SafeParse, IntFallsBackToDefault)
{
    EXPECT_FALSE(safeInt(std::string("twelve")).has_value());
    EXPECT_EQ(*safeInt(std::string("twelve"), 5), 5);
    EXPECT_EQ(*safeInt(std::string("nan"), 6), 6);
}

TEST(SafeParse, RemovesLeadingBomOnly)
{
    EXPECT_EQ(removeBom("\xEF\xBB\xBF" "a=1"), "a=1");
    EXPECT_EQ(removeBom("a=1"), "a=1");
    EXPECT_EQ(removeBom(""), "");
    EXPECT_EQ(removeBom("a\xEF\xBB\xBF"), "a\xEF\xBB\xBF");
}
