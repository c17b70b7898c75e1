#include <gtest/gtest.h>
#include "fomc_ngin/core/calendar.hpp"
#include "../test_utils.hpp"

using namespace fomc_ngin;
using fomc_ngin::testing::epoch;
using fomc_ngin::testing::utc;

class CalendarTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto zone = TimeZoneRule::lookup("America/New_York");
        ASSERT_TRUE(zone.is_ok());
        new_york_ = zone.value();
    }

    TimeZoneRule new_york_;
    const int two_thirty_pm_ = 14 * 3600 + 30 * 60;
};

TEST_F(CalendarTest, ParseDate) {
    auto date = CalendarDate::parse("2023-11-01");
    ASSERT_TRUE(date.is_ok());
    EXPECT_EQ(date.value(), CalendarDate(2023, 11, 1));
    EXPECT_EQ(date.value().to_string(), "2023-11-01");

    EXPECT_TRUE(CalendarDate::parse("2023-13-01").is_error());
    EXPECT_TRUE(CalendarDate::parse("2023-02-29").is_error());
    EXPECT_TRUE(CalendarDate::parse("2024-02-29").is_ok());
    EXPECT_TRUE(CalendarDate::parse("2023/11/01").is_error());
    EXPECT_TRUE(CalendarDate::parse("fomc-2023").is_error());
    EXPECT_EQ(CalendarDate::parse("").error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(CalendarTest, LeapYearsAndMonthLengths) {
    EXPECT_TRUE(calendar::is_leap_year(2024));
    EXPECT_TRUE(calendar::is_leap_year(2000));
    EXPECT_FALSE(calendar::is_leap_year(1900));
    EXPECT_FALSE(calendar::is_leap_year(2023));

    EXPECT_EQ(calendar::days_in_month(2024, 2), 29);
    EXPECT_EQ(calendar::days_in_month(2023, 2), 28);
    EXPECT_EQ(calendar::days_in_month(2023, 11), 30);
    EXPECT_EQ(calendar::days_in_month(2023, 12), 31);
    EXPECT_EQ(calendar::days_in_month(2023, 13), 0);
}

TEST_F(CalendarTest, CivilDayConversions) {
    EXPECT_EQ(calendar::days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(calendar::days_from_civil(2023, 1, 1), 19358);
    EXPECT_EQ(calendar::civil_from_days(19662), CalendarDate(2023, 11, 1));
    EXPECT_EQ(calendar::civil_from_days(-1), CalendarDate(1969, 12, 31));

    EXPECT_EQ(calendar::weekday(CalendarDate(1970, 1, 1)), 4);
    EXPECT_EQ(calendar::weekday(CalendarDate(2023, 11, 1)), 3);
}

TEST_F(CalendarTest, AddMonthsRollsYearAndClampsDay) {
    EXPECT_EQ(calendar::add_months(CalendarDate(2023, 11, 1), 1), CalendarDate(2023, 12, 1));
    EXPECT_EQ(calendar::add_months(CalendarDate(2023, 12, 13), 1), CalendarDate(2024, 1, 13));
    EXPECT_EQ(calendar::add_months(CalendarDate(2024, 1, 31), 1), CalendarDate(2024, 2, 29));
    EXPECT_EQ(calendar::add_months(CalendarDate(2024, 3, 15), -3), CalendarDate(2023, 12, 15));
}

TEST_F(CalendarTest, WeekdayRules) {
    // DST 2023: second Sunday of March, first Sunday of November
    EXPECT_EQ(calendar::nth_weekday_of_month(2023, 3, 0, 2), 12);
    EXPECT_EQ(calendar::nth_weekday_of_month(2023, 11, 0, 1), 5);
    EXPECT_EQ(calendar::last_weekday_of_month(2006, 10, 0), 29);
}

TEST_F(CalendarTest, ParseTimeOfDay) {
    EXPECT_EQ(calendar::parse_time_of_day("14:30").value(), 52200);
    EXPECT_EQ(calendar::parse_time_of_day("14:30:15").value(), 52215);
    EXPECT_TRUE(calendar::parse_time_of_day("24:00").is_error());
    EXPECT_TRUE(calendar::parse_time_of_day("2:30pm").is_error());
}

TEST_F(CalendarTest, ParseIsoTimestamp) {
    auto zulu = calendar::parse_iso_timestamp("2023-11-01T18:30:00Z");
    ASSERT_TRUE(zulu.is_ok());
    EXPECT_EQ(zulu.value(), utc(2023, 11, 1, 18, 30, 0));

    auto offset = calendar::parse_iso_timestamp("2023-11-01 14:30:00-04:00");
    ASSERT_TRUE(offset.is_ok());
    EXPECT_EQ(offset.value(), utc(2023, 11, 1, 18, 30, 0));

    auto fraction = calendar::parse_iso_timestamp("2023-11-01T18:30:00.250");
    ASSERT_TRUE(fraction.is_ok());
    EXPECT_EQ(fraction.value(), utc(2023, 11, 1, 18, 30, 0, 250));

    EXPECT_EQ(calendar::parse_iso_timestamp("2023-11-01").error()->code(),
              ErrorCode::CONVERSION_ERROR);
    EXPECT_TRUE(calendar::parse_iso_timestamp("2023-11-01T18:30:00+0400").is_error());
}

TEST_F(CalendarTest, AnchorInDaylightTime) {
    auto t0 = new_york_.to_utc(CalendarDate(2023, 11, 1), two_thirty_pm_);
    ASSERT_TRUE(t0.is_ok());
    EXPECT_EQ(t0.value(), epoch(2023, 11, 1, 18, 30, 0));
}

TEST_F(CalendarTest, AnchorInStandardTime) {
    auto t0 = new_york_.to_utc(CalendarDate(2024, 1, 31), two_thirty_pm_);
    ASSERT_TRUE(t0.is_ok());
    EXPECT_EQ(t0.value(), epoch(2024, 1, 31, 19, 30, 0));

    // Day after fall-back is already standard time
    auto after = new_york_.to_utc(CalendarDate(2023, 11, 5), two_thirty_pm_);
    ASSERT_TRUE(after.is_ok());
    EXPECT_EQ(after.value(), epoch(2023, 11, 5, 19, 30, 0));
}

TEST_F(CalendarTest, PreviousRuleEra) {
    // 1987-2006: first Sunday of April to last Sunday of October
    auto march = new_york_.to_utc(CalendarDate(2006, 3, 22), two_thirty_pm_);
    ASSERT_TRUE(march.is_ok());
    EXPECT_EQ(march.value(), epoch(2006, 3, 22, 19, 30, 0));

    auto may = new_york_.to_utc(CalendarDate(2006, 5, 10), two_thirty_pm_);
    ASSERT_TRUE(may.is_ok());
    EXPECT_EQ(may.value(), epoch(2006, 5, 10, 18, 30, 0));
}

TEST_F(CalendarTest, SkippedAndRepeatedWallTimesAreAmbiguous) {
    auto gap = new_york_.to_utc(CalendarDate(2023, 3, 12), 2 * 3600 + 30 * 60);
    ASSERT_TRUE(gap.is_error());
    EXPECT_EQ(gap.error()->code(), ErrorCode::AMBIGUOUS_TIMESTAMP);

    auto overlap = new_york_.to_utc(CalendarDate(2023, 11, 5), 1 * 3600 + 30 * 60);
    ASSERT_TRUE(overlap.is_error());
    EXPECT_EQ(overlap.error()->code(), ErrorCode::AMBIGUOUS_TIMESTAMP);

    auto before_gap = new_york_.to_utc(CalendarDate(2023, 3, 12), 1 * 3600 + 59 * 60);
    ASSERT_TRUE(before_gap.is_ok());
    EXPECT_EQ(before_gap.value(), epoch(2023, 3, 12, 6, 59, 0));
}

TEST_F(CalendarTest, YearsWithoutRuleAreAmbiguous) {
    auto result = new_york_.to_utc(CalendarDate(1985, 7, 10), two_thirty_pm_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::AMBIGUOUS_TIMESTAMP);
}

TEST_F(CalendarTest, ZoneLookup) {
    auto utc_zone = TimeZoneRule::lookup("UTC");
    ASSERT_TRUE(utc_zone.is_ok());
    EXPECT_EQ(utc_zone.value().to_utc(CalendarDate(1985, 7, 10), 0).value(),
              epoch(1985, 7, 10, 0, 0, 0));

    auto chicago = TimeZoneRule::lookup("America/Chicago");
    ASSERT_TRUE(chicago.is_ok());
    EXPECT_EQ(chicago.value().to_utc(CalendarDate(2023, 11, 1), 13 * 3600 + 30 * 60).value(),
              epoch(2023, 11, 1, 18, 30, 0));

    auto unknown = TimeZoneRule::lookup("Mars/Olympus");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::CONFIGURATION_ERROR);
}
