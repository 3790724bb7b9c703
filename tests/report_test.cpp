#include <gtest/gtest.h>

#include "report.hpp"

using alignkit::config::Report;

TEST(Report, StartsPassedAndEmpty)
{
    Report report;
    EXPECT_TRUE(report.passed());
    EXPECT_TRUE(report.errors().empty());
    EXPECT_TRUE(report.warnings().empty());
    EXPECT_EQ(report.summary(), "");
}

TEST(Report, ErrorsDoNotFailByThemselves)
{
    Report report;
    report.addError("bad");
    EXPECT_TRUE(report.passed());
    report.markFailed();
    EXPECT_FALSE(report.passed());
}

TEST(Report, MergePropagatesFailureAndMessages)
{
    Report outer;
    outer.addWarning("w1");

    Report inner;
    inner.addWarning("w2");
    inner.addError("e1");
    inner.markFailed();

    outer.merge(inner);
    EXPECT_FALSE(outer.passed());
    ASSERT_EQ(outer.warnings().size(), 2u);
    EXPECT_EQ(outer.warnings()[1], "w2");
    ASSERT_EQ(outer.errors().size(), 1u);
    EXPECT_EQ(outer.summary(), "ERROR: e1\nWARNING: w1\nWARNING: w2\n");
}
