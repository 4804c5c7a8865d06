/**
 * @file test_duration.cpp
 * @brief Tests for period parsing, formatting and comparison
 */

#include <gtest/gtest.h>
#include "confres/Duration.hpp"

using namespace confres;

// ============================================================================
// parse_period
// ============================================================================

TEST(ParsePeriod, SingleUnits) {
    EXPECT_EQ(parse_period("14d"), Period::of_days(14));
    EXPECT_EQ(parse_period("12h"), Period::of_hours(12));
    EXPECT_EQ(parse_period("30m"), Period::of_minutes(30));

    auto seconds = parse_period("10s");
    ASSERT_TRUE(seconds.has_value());
    EXPECT_EQ(seconds->seconds, 10);

    auto millis = parse_period("500ms");
    ASSERT_TRUE(millis.has_value());
    EXPECT_EQ(millis->millis, 500);
    EXPECT_EQ(millis->minutes, 0);
}

TEST(ParsePeriod, CombinedUnits) {
    auto p = parse_period("1d2h3m4s5ms");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->days, 1);
    EXPECT_EQ(p->hours, 2);
    EXPECT_EQ(p->minutes, 3);
    EXPECT_EQ(p->seconds, 4);
    EXPECT_EQ(p->millis, 5);
}

TEST(ParsePeriod, SurroundingWhitespaceIgnored) {
    EXPECT_EQ(parse_period("  7d "), Period::of_days(7));
}

TEST(ParsePeriod, ZeroIsAllowed) {
    auto p = parse_period("0s");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, Period{});
}

TEST(ParsePeriod, Rejected) {
    EXPECT_FALSE(parse_period("").has_value());
    EXPECT_FALSE(parse_period("14").has_value());
    EXPECT_FALSE(parse_period("d").has_value());
    EXPECT_FALSE(parse_period("1w").has_value());
    EXPECT_FALSE(parse_period("-1d").has_value());
    EXPECT_FALSE(parse_period("1d 2h").has_value());
    EXPECT_FALSE(parse_period("30m1h").has_value());
    EXPECT_FALSE(parse_period("1d1d").has_value());
    EXPECT_FALSE(parse_period("99999999999999999999d").has_value());
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatPeriod, CompactText) {
    EXPECT_EQ(format_period(Period::of_days(14)), "14d");
    EXPECT_EQ(format_period(*parse_period("1h30m")), "1h30m");
    EXPECT_EQ(format_period(*parse_period("2s250ms")), "2s250ms");
    EXPECT_EQ(format_period(Period{}), "0s");
}

TEST(FormatPeriod, ReparsesToSamePeriod) {
    const Period p = *parse_period("3d4h");
    EXPECT_EQ(parse_period(format_period(p)), p);
}

TEST(Iso8601, DaysAndTimes) {
    EXPECT_EQ(iso8601(Period::of_days(14)), "P14D");
    EXPECT_EQ(iso8601(*parse_period("1h30m")), "PT1H30M");
    EXPECT_EQ(iso8601(*parse_period("1d12h")), "P1DT12H");
    EXPECT_EQ(iso8601(Period{}), "PT0S");
}

TEST(Iso8601, FractionalSeconds) {
    EXPECT_EQ(iso8601(*parse_period("1s500ms")), "PT1.500S");
    EXPECT_EQ(iso8601(*parse_period("1500ms")), "PT1.500S");
    EXPECT_EQ(iso8601(*parse_period("2000ms")), "PT2S");
    EXPECT_EQ(iso8601(*parse_period("5ms")), "PT0.005S");
}

// ============================================================================
// Comparison
// ============================================================================

TEST(PeriodLonger, ComparesStandardLength) {
    EXPECT_TRUE(period_longer(Period::of_days(30), Period::of_days(14)));
    EXPECT_FALSE(period_longer(Period::of_days(14), Period::of_days(14)));
    EXPECT_FALSE(period_longer(Period::of_hours(24), Period::of_days(1)));
    EXPECT_TRUE(period_longer(Period::of_hours(25), Period::of_days(1)));
    EXPECT_TRUE(period_longer(Period::of_minutes(1), *parse_period("59s")));
}

TEST(PeriodLonger, StandardLength) {
    EXPECT_EQ(Period::of_days(1).to_standard(), std::chrono::milliseconds(86400000));
    EXPECT_EQ(parse_period("1m1s")->to_standard(), std::chrono::milliseconds(61000));
}

TEST(PeriodLonger, MixedUnits) {
    EXPECT_TRUE(period_longer(*parse_period("48h"), *parse_period("1d")));
    EXPECT_FALSE(period_longer(*parse_period("24h"), *parse_period("1d")));
    EXPECT_TRUE(period_longer(*parse_period("1d1ms"), *parse_period("86400s")));
    EXPECT_FALSE(period_longer(*parse_period("336h"), Period::of_days(14)));
    EXPECT_TRUE(period_longer(*parse_period("337h"), Period::of_days(14)));
}

// ============================================================================
// Range of representable periods
// ============================================================================

TEST(ParsePeriod, LargestDayCountAccepted) {
    // 106751991167 days is the last whole day below 2^63 - 1 milliseconds
    auto p = parse_period("106751991167d");
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(period_longer(*p, Period::of_days(14)));
}

TEST(ParsePeriod, LengthBeyondMillisecondRangeRejected) {
    EXPECT_FALSE(parse_period("106751991168d").has_value());
    EXPECT_FALSE(parse_period("9999999999999h").has_value());
    EXPECT_FALSE(parse_period("99999999999999d").has_value());
    // each field fits, the sum does not
    EXPECT_FALSE(parse_period("106751991167d23h59m59s999ms").has_value());
}

TEST(PeriodLonger, SaturatesInsteadOfWrapping) {
    Period huge;
    huge.hours = 9999999999999;
    EXPECT_TRUE(period_longer(huge, Period::of_days(14)));
    EXPECT_FALSE(period_longer(Period::of_days(14), huge));
    EXPECT_EQ(huge.to_standard(), std::chrono::milliseconds::max());
}
