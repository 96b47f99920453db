#pragma once

#include "tempora/error.hpp"

#include <absl/time/civil_time.h>
#include <compare>

#include <cstdint>
#include <fmt/format.h>

namespace tempora {

/**
 * @brief Units accepted by DateTime::modify()
 *
 * Calendar units (day, week, month, year) move the wall clock; time units
 * (microsecond through hour) move the absolute instant.
 */
enum class CalendarUnit : uint8_t { microsecond, second, minute, hour, day, week, month, year };

[[nodiscard]] constexpr const char* calendar_unit_string(CalendarUnit unit) noexcept {
    switch (unit) {
        case CalendarUnit::microsecond:
            return "microsecond";
        case CalendarUnit::second:
            return "second";
        case CalendarUnit::minute:
            return "minute";
        case CalendarUnit::hour:
            return "hour";
        case CalendarUnit::day:
            return "day";
        case CalendarUnit::week:
            return "week";
        case CalendarUnit::month:
            return "month";
        case CalendarUnit::year:
            return "year";
    }
    return "unknown";
}

/// Calendar units move civil fields; the rest move the absolute instant
[[nodiscard]] constexpr bool is_calendar_based(CalendarUnit unit) noexcept {
    return unit == CalendarUnit::day || unit == CalendarUnit::week ||
           unit == CalendarUnit::month || unit == CalendarUnit::year;
}

/**
 * @brief Day in the proleptic Gregorian calendar
 *
 * Thin validated wrapper over absl::CivilDay. Construction through create()
 * rejects dates that do not exist instead of normalizing them, so
 * Date::create(2021, 2, 29) fails rather than yielding March 1st.
 */
class Date {
public:
    static constexpr int64_t MIN_YEAR = -99'999;
    static constexpr int64_t MAX_YEAR = 99'999;

    /// 1970-01-01
    constexpr Date() noexcept = default;

    static Result<Date> create(int64_t year, int month, int day) {
        if (year < MIN_YEAR || year > MAX_YEAR) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("year {} is outside [{}, {}]", year, MIN_YEAR, MAX_YEAR));
        }
        absl::CivilDay civil(year, month, day);
        if (civil.year() != year || civil.month() != month || civil.day() != day) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("{:04}-{:02}-{:02} is not a valid date", year, month, day));
        }
        return Date(civil);
    }

    /// Wrap an already-normalized civil day (no validation needed)
    static constexpr Date from_civil(absl::CivilDay civil) noexcept { return Date(civil); }

    constexpr int64_t year() const noexcept { return civil_.year(); }
    constexpr int month() const noexcept { return civil_.month(); }
    constexpr int day() const noexcept { return civil_.day(); }

    /// ISO weekday: 1 = Monday ... 7 = Sunday
    int day_of_week() const noexcept {
        switch (absl::GetWeekday(civil_)) {
            case absl::Weekday::monday:
                return 1;
            case absl::Weekday::tuesday:
                return 2;
            case absl::Weekday::wednesday:
                return 3;
            case absl::Weekday::thursday:
                return 4;
            case absl::Weekday::friday:
                return 5;
            case absl::Weekday::saturday:
                return 6;
            case absl::Weekday::sunday:
                return 7;
        }
        return 0;
    }

    int day_of_year() const noexcept { return absl::GetYearDay(civil_); }

    constexpr bool is_leap_year() const noexcept {
        int64_t y = civil_.year();
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    constexpr int days_in_month() const noexcept {
        constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        int m = civil_.month();
        return (m == 2 && is_leap_year()) ? 29 : days[m - 1];
    }

    /// Saturates at the first and last day of the supported year range
    Date add_days(int64_t days) const noexcept {
        constexpr int64_t MAX_STEP = (MAX_YEAR - MIN_YEAR + 1) * 366;
        days = days < -MAX_STEP ? -MAX_STEP : (days > MAX_STEP ? MAX_STEP : days);
        return Date(clamp(civil_ + days));
    }

    /**
     * Shift by whole months, clamping the day to the end of the target month
     *
     * 2020-01-31 + 1 month is 2020-02-29; 2021-01-31 + 1 month is 2021-02-28.
     * Saturates at January of MIN_YEAR and December of MAX_YEAR.
     */
    Date add_months(int64_t months) const noexcept {
        constexpr int64_t MAX_STEP = (MAX_YEAR - MIN_YEAR + 1) * 12;
        months = months < -MAX_STEP ? -MAX_STEP : (months > MAX_STEP ? MAX_STEP : months);
        absl::CivilMonth target = absl::CivilMonth(civil_) + months;
        if (target < absl::CivilMonth(MIN_YEAR, 1)) {
            target = absl::CivilMonth(MIN_YEAR, 1);
        } else if (target > absl::CivilMonth(MAX_YEAR, 12)) {
            target = absl::CivilMonth(MAX_YEAR, 12);
        }
        Date first{absl::CivilDay(target)};
        int last_day = first.days_in_month();
        int d = civil_.day() < last_day ? civil_.day() : last_day;
        return Date(absl::CivilDay(target.year(), target.month(), d));
    }

    constexpr absl::CivilDay to_civil() const noexcept { return civil_; }

    constexpr std::strong_ordering operator<=>(const Date&) const noexcept = default;

private:
    absl::CivilDay civil_{1970, 1, 1};

    constexpr explicit Date(absl::CivilDay civil) noexcept : civil_(civil) {}

    static constexpr absl::CivilDay clamp(absl::CivilDay civil) noexcept {
        constexpr absl::CivilDay lowest(MIN_YEAR, 1, 1);
        constexpr absl::CivilDay highest(MAX_YEAR, 12, 31);
        return civil < lowest ? lowest : (civil > highest ? highest : civil);
    }
};

/**
 * @brief Time of day with microsecond resolution
 */
class Time {
public:
    constexpr Time() noexcept = default;

    static Result<Time> create(int hour, int minute, int second, int microsecond = 0) {
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 ||
            microsecond < 0 || microsecond > 999'999) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("{:02}:{:02}:{:02}.{:06} is not a valid time of day",
                                          hour, minute, second, microsecond));
        }
        return Time(hour, minute, second, microsecond);
    }

    /// Wall-clock fields of an already-normalized civil second
    static constexpr Time from_civil(absl::CivilSecond civil, int microsecond) noexcept {
        return Time(civil.hour(), civil.minute(), civil.second(), microsecond);
    }

    static constexpr Time midnight() noexcept { return Time(0, 0, 0, 0); }
    static constexpr Time noon() noexcept { return Time(12, 0, 0, 0); }
    static constexpr Time end_of_day() noexcept { return Time(23, 59, 59, 999'999); }

    constexpr int hour() const noexcept { return hour_; }
    constexpr int minute() const noexcept { return minute_; }
    constexpr int second() const noexcept { return second_; }
    constexpr int microsecond() const noexcept { return microsecond_; }

    constexpr auto operator<=>(const Time&) const noexcept = default;

private:
    int hour_{0};
    int minute_{0};
    int second_{0};
    int microsecond_{0};

    constexpr Time(int hour, int minute, int second, int microsecond) noexcept
        : hour_(hour),
          minute_(minute),
          second_(second),
          microsecond_(microsecond) {}
};

} // namespace tempora
