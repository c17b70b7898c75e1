// src/core/calendar.cpp

#include "fomc_ngin/core/calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace fomc_ngin {

namespace {

constexpr int kSecondsPerDay = 86400;
constexpr int kSecondsPerHour = 3600;

bool all_digits(const std::string& text, size_t pos, size_t len) {
    if (pos + len > text.size())
        return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
            return false;
    }
    return true;
}

int to_int(const std::string& text, size_t pos, size_t len) {
    return std::stoi(text.substr(pos, len));
}

}  // namespace

Result<CalendarDate> CalendarDate::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !all_digits(text, 0, 4) ||
        !all_digits(text, 5, 2) || !all_digits(text, 8, 2)) {
        return make_error<CalendarDate>(ErrorCode::INVALID_ARGUMENT,
                                        "Expected YYYY-MM-DD date, got '" + text + "'",
                                        "CalendarDate");
    }
    CalendarDate date(to_int(text, 0, 4), to_int(text, 5, 2), to_int(text, 8, 2));
    if (!date.is_valid()) {
        return make_error<CalendarDate>(ErrorCode::INVALID_ARGUMENT,
                                        "Date out of range: '" + text + "'", "CalendarDate");
    }
    return date;
}

bool CalendarDate::is_valid() const {
    return month >= 1 && month <= 12 && day >= 1 && day <= calendar::days_in_month(year, month);
}

std::string CalendarDate::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

namespace calendar {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12)
        return 0;
    if (month == 2 && is_leap_year(year))
        return 29;
    return kDays[month - 1];
}

// Howard Hinnant's civil-day algorithms
std::int64_t days_from_civil(int year, int month, int day) {
    std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate civil_from_days(std::int64_t days) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
    return CalendarDate(year, month, day);
}

int weekday(const CalendarDate& date) {
    std::int64_t days = days_from_civil(date.year, date.month, date.day);
    // 1970-01-01 was a Thursday
    int w = static_cast<int>((days + 4) % 7);
    return w < 0 ? w + 7 : w;
}

CalendarDate add_months(const CalendarDate& date, int months) {
    int total = date.year * 12 + (date.month - 1) + months;
    int year = total / 12;
    int month = total % 12 + 1;
    int day = std::min(date.day, days_in_month(year, month));
    return CalendarDate(year, month, day);
}

int nth_weekday_of_month(int year, int month, int wday, int n) {
    int first = weekday(CalendarDate(year, month, 1));
    int offset = (wday - first + 7) % 7;
    return 1 + offset + (n - 1) * 7;
}

int last_weekday_of_month(int year, int month, int wday) {
    int last_day = days_in_month(year, month);
    int last = weekday(CalendarDate(year, month, last_day));
    return last_day - (last - wday + 7) % 7;
}

Result<int> parse_time_of_day(const std::string& text) {
    bool short_form = text.size() == 5 && text[2] == ':';
    bool long_form = text.size() == 8 && text[2] == ':' && text[5] == ':';
    if ((!short_form && !long_form) || !all_digits(text, 0, 2) || !all_digits(text, 3, 2) ||
        (long_form && !all_digits(text, 6, 2))) {
        return make_error<int>(ErrorCode::INVALID_ARGUMENT,
                               "Expected HH:MM or HH:MM:SS, got '" + text + "'", "Calendar");
    }
    int hours = to_int(text, 0, 2);
    int minutes = to_int(text, 3, 2);
    int seconds = long_form ? to_int(text, 6, 2) : 0;
    if (hours > 23 || minutes > 59 || seconds > 59) {
        return make_error<int>(ErrorCode::INVALID_ARGUMENT,
                               "Time of day out of range: '" + text + "'", "Calendar");
    }
    return hours * kSecondsPerHour + minutes * 60 + seconds;
}

Result<Timestamp> parse_iso_timestamp(const std::string& text) {
    if (text.size() < 19) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Timestamp too short: '" + text + "'", "Calendar");
    }
    auto date_result = CalendarDate::parse(text.substr(0, 10));
    if (date_result.is_error() || (text[10] != 'T' && text[10] != ' ')) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Malformed timestamp: '" + text + "'", "Calendar");
    }
    auto tod_result = parse_time_of_day(text.substr(11, 8));
    if (tod_result.is_error()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Malformed time in timestamp: '" + text + "'", "Calendar");
    }

    size_t pos = 19;
    std::int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 9; ++digits)
            nanos *= 10;
    }

    int offset_s = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z' && pos + 1 == text.size()) {
            offset_s = 0;
        } else if ((sign == '+' || sign == '-') && text.size() == pos + 6 && text[pos + 3] == ':' &&
                   all_digits(text, pos + 1, 2) && all_digits(text, pos + 4, 2)) {
            offset_s = to_int(text, pos + 1, 2) * kSecondsPerHour + to_int(text, pos + 4, 2) * 60;
            if (sign == '-')
                offset_s = -offset_s;
        } else {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Malformed UTC offset in timestamp: '" + text + "'",
                                         "Calendar");
        }
    }

    const CalendarDate& date = date_result.value();
    EpochSeconds secs = days_from_civil(date.year, date.month, date.day) * kSecondsPerDay +
                        tod_result.value() - offset_s;
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos)));
}

}  // namespace calendar

Result<TimeZoneRule> TimeZoneRule::lookup(const std::string& name) {
    static const std::unordered_map<std::string, TimeZoneRule> kZones = {
        {"America/New_York", TimeZoneRule("America/New_York", -5 * kSecondsPerHour, true)},
        {"US/Eastern", TimeZoneRule("US/Eastern", -5 * kSecondsPerHour, true)},
        {"America/Chicago", TimeZoneRule("America/Chicago", -6 * kSecondsPerHour, true)},
        {"US/Central", TimeZoneRule("US/Central", -6 * kSecondsPerHour, true)},
        {"America/Denver", TimeZoneRule("America/Denver", -7 * kSecondsPerHour, true)},
        {"America/Los_Angeles", TimeZoneRule("America/Los_Angeles", -8 * kSecondsPerHour, true)},
        {"UTC", TimeZoneRule("UTC", 0, false)},
    };
    auto it = kZones.find(name);
    if (it == kZones.end()) {
        return make_error<TimeZoneRule>(ErrorCode::CONFIGURATION_ERROR,
                                        "Unsupported time zone: " + name, "TimeZoneRule");
    }
    return it->second;
}

Result<EpochSeconds> TimeZoneRule::to_utc(const CalendarDate& date, int seconds_of_day) const {
    if (!date.is_valid() || seconds_of_day < 0 || seconds_of_day >= kSecondsPerDay) {
        return make_error<EpochSeconds>(ErrorCode::INVALID_ARGUMENT,
                                        "Invalid local date/time " + date.to_string(),
                                        "TimeZoneRule");
    }

    // Local wall time expressed as if it were UTC
    const EpochSeconds wall =
        calendar::days_from_civil(date.year, date.month, date.day) * kSecondsPerDay +
        seconds_of_day;

    if (!observes_us_dst_) {
        return wall - standard_offset_s_;
    }

    int start_month, start_day, end_month, end_day;
    if (date.year >= 2007) {
        start_month = 3;
        start_day = calendar::nth_weekday_of_month(date.year, 3, 0, 2);
        end_month = 11;
        end_day = calendar::nth_weekday_of_month(date.year, 11, 0, 1);
    } else if (date.year >= 1987) {
        start_month = 4;
        start_day = calendar::nth_weekday_of_month(date.year, 4, 0, 1);
        end_month = 10;
        end_day = calendar::last_weekday_of_month(date.year, 10, 0);
    } else {
        return make_error<EpochSeconds>(ErrorCode::AMBIGUOUS_TIMESTAMP,
                                        "No daylight-saving rule for year " +
                                            std::to_string(date.year) + " in " + name_,
                                        "TimeZoneRule");
    }

    const EpochSeconds gap_start =
        calendar::days_from_civil(date.year, start_month, start_day) * kSecondsPerDay +
        2 * kSecondsPerHour;
    const EpochSeconds overlap_start =
        calendar::days_from_civil(date.year, end_month, end_day) * kSecondsPerDay +
        1 * kSecondsPerHour;

    if (wall >= gap_start && wall < gap_start + kSecondsPerHour) {
        return make_error<EpochSeconds>(ErrorCode::AMBIGUOUS_TIMESTAMP,
                                        "Local time skipped by DST start on " + date.to_string() +
                                            " in " + name_,
                                        "TimeZoneRule");
    }
    if (wall >= overlap_start && wall < overlap_start + kSecondsPerHour) {
        return make_error<EpochSeconds>(ErrorCode::AMBIGUOUS_TIMESTAMP,
                                        "Local time repeated by DST end on " + date.to_string() +
                                            " in " + name_,
                                        "TimeZoneRule");
    }

    bool dst = wall >= gap_start + kSecondsPerHour && wall < overlap_start;
    int offset = standard_offset_s_ + (dst ? kSecondsPerHour : 0);
    return wall - offset;
}

}  // namespace fomc_ngin
