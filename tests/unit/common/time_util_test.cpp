/// @file time_util_test.cpp
/// @brief Tests for UTC timestamp and calendar-day helpers

#include <gtest/gtest.h>

#include "common/time_util.h"

namespace runlens {
namespace {

TEST(TimeUtilTest, TimestampRoundTripsThroughText) {
    auto ts = ParseTimestamp("2026-03-01T10:15:00Z");
    ASSERT_TRUE(ts.ok());
    EXPECT_EQ(FormatTimestamp(*ts), "2026-03-01T10:15:00Z");
}

TEST(TimeUtilTest, OffsetsAreNormalizedToUtc) {
    auto ts = ParseTimestamp("2026-03-01T01:30:00+02:00");
    ASSERT_TRUE(ts.ok());
    EXPECT_EQ(FormatDay(ToCivilDay(*ts)), "2026-02-28");
}

TEST(TimeUtilTest, InvalidTimestamp) {
    EXPECT_TRUE(absl::IsInvalidArgument(ParseTimestamp("yesterday").status()));
}

TEST(TimeUtilTest, DayBounds) {
    auto day = ParseDay("2026-01-15");
    ASSERT_TRUE(day.ok());

    EXPECT_EQ(FormatTimestamp(StartOfDay(*day)), "2026-01-15T00:00:00Z");
    EXPECT_EQ(FormatTimestamp(EndOfDay(*day)), "2026-01-15T23:59:59Z");
    EXPECT_DOUBLE_EQ(SecondsBetween(StartOfDay(*day), EndOfDay(*day)), 86399.0);
}

TEST(TimeUtilTest, InvalidDay) {
    EXPECT_FALSE(ParseDay("15/01/2026").ok());
}

}  // namespace
}  // namespace runlens
