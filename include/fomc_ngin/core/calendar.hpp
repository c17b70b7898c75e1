// include/fomc_ngin/core/calendar.hpp
#pragma once

#include <cstdint>
#include <string>
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"

namespace fomc_ngin {

/**
 * @brief Proleptic Gregorian calendar date
 */
struct CalendarDate {
    int year{1970};
    int month{1};  // 1-12
    int day{1};    // 1-31

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parse a YYYY-MM-DD string
     * @return The date, or INVALID_ARGUMENT for malformed or out-of-range input
     */
    static Result<CalendarDate> parse(const std::string& text);

    bool is_valid() const;

    /**
     * @brief YYYY-MM-DD
     */
    std::string to_string() const;

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const {
        return !(*this == other);
    }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year)
            return year < other.year;
        if (month != other.month)
            return month < other.month;
        return day < other.day;
    }
};

namespace calendar {

bool is_leap_year(int year);

/**
 * @brief Number of days in a month, 0 when month is outside 1-12
 */
int days_in_month(int year, int month);

/**
 * @brief Days since 1970-01-01 for a civil date
 */
std::int64_t days_from_civil(int year, int month, int day);

CalendarDate civil_from_days(std::int64_t days);

/**
 * @brief Day of week, 0 = Sunday
 */
int weekday(const CalendarDate& date);

/**
 * @brief Shift by whole months, rolling the year; the day is clamped to the target month
 */
CalendarDate add_months(const CalendarDate& date, int months);

/**
 * @brief Day-of-month of the n-th (1-based) given weekday in a month
 */
int nth_weekday_of_month(int year, int month, int weekday, int n);

int last_weekday_of_month(int year, int month, int weekday);

/**
 * @brief Parse "HH:MM" or "HH:MM:SS" into seconds after midnight
 */
Result<int> parse_time_of_day(const std::string& text);

/**
 * @brief Parse an ISO-8601 instant (YYYY-MM-DD[T ]HH:MM:SS[.fraction][Z|+HH:MM])
 */
Result<Timestamp> parse_iso_timestamp(const std::string& text);

}  // namespace calendar

/**
 * @brief Fixed-offset zone with optional US daylight-saving rules
 *
 * US rules: from 2007 DST runs from the second Sunday of March to the first
 * Sunday of November; 1987-2006 from the first Sunday of April to the last
 * Sunday of October. Transitions happen at 02:00 local wall time.
 */
class TimeZoneRule {
public:
    /**
     * @brief Look up a supported zone by IANA name
     * @return CONFIGURATION_ERROR for unknown zone names
     */
    static Result<TimeZoneRule> lookup(const std::string& name);

    TimeZoneRule() = default;
    TimeZoneRule(std::string name, int standard_offset_s, bool observes_us_dst)
        : name_(std::move(name)),
          standard_offset_s_(standard_offset_s),
          observes_us_dst_(observes_us_dst) {}

    /**
     * @brief Convert a local wall-clock time on a date to UTC epoch seconds
     *
     * Wall times inside the spring-forward gap do not exist and wall times
     * inside the fall-back hour occur twice. Both fail with AMBIGUOUS_TIMESTAMP,
     * as do years without a known DST rule.
     */
    Result<EpochSeconds> to_utc(const CalendarDate& date, int seconds_of_day) const;

    const std::string& name() const {
        return name_;
    }

private:
    std::string name_{"UTC"};
    int standard_offset_s_{0};
    bool observes_us_dst_{false};
};

}  // namespace fomc_ngin
