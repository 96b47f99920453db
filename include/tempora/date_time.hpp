#pragma once

#include "tempora/calendar.hpp"
#include "tempora/detail/iso8601.hpp"
#include "tempora/detail/time_math.hpp"
#include "tempora/error.hpp"
#include "tempora/time_offset.hpp"
#include "tempora/time_unit.hpp"
#include "tempora/time_zone.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <cstdint>
#include <fmt/format.h>

namespace tempora {

class LeapSeconds;
class TimeEpoch;
class TimePeriod;
class TimePeriods;

/**
 * @brief Point in time on the proleptic Gregorian calendar
 *
 * A DateTime is a civil date and time of day anchored either to a named
 * TimeZone or to a fixed TimeOffset, together with the offset that anchor
 * resolves to at that instant. Values are immutable: every operation that
 * reads like a mutation returns a new DateTime.
 *
 * ## Anchors
 * - Named zone: the offset is re-resolved from the zone whenever the civil
 *   fields change, so arithmetic crosses daylight-saving transitions correctly.
 * - Fixed offset: the offset never changes and time_zone() is empty.
 *
 * ## Gaps and overlaps
 * A wall time skipped by a transition (02:30 in a 02:00 -> 03:00 gap) is
 * resolved with the offset in effect before the transition and normalized to
 * the wall time that exists (03:30). A repeated wall time resolves to the
 * earlier of its two instants.
 *
 * ## Comparison
 * is_equal() and friends compare absolute instants:
 * 12:00+02:00 is equal to 10:00Z.
 *
 * Example:
 * @code
 *   auto dt = DateTime::create(2020, 1, 31, 10, 0, 0);
 *   auto next = dt->add_month();   // 2020-02-29T10:00:00+00:00
 * @endcode
 */
class DateTime {
public:
    using Anchor = std::variant<TimeOffset, TimeZone>;

    /// 1970-01-01T00:00:00+00:00
    DateTime() = default;

    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief General constructor from validated leaf values
     *
     * - zone and offset: the zone's offset at the instant `date time offset`
     *   names must equal offset, else ErrorCode::invalid_argument
     * - zone only: offset is resolved from the zone
     * - offset only: zone stays unset
     * - neither: zone unset, offset UTC
     */
    static Result<DateTime> make(Date date, Time time, std::optional<TimeZone> zone = std::nullopt,
                                 std::optional<TimeOffset> offset = std::nullopt) {
        absl::CivilSecond civil = to_civil(date, time);
        if (zone && offset) {
            // Both instants of a repeated wall time are accepted
            int64_t seconds =
                (civil - absl::CivilSecond(1970, 1, 1, 0, 0, 0)) - offset->total_seconds();
            TimeOffset resolved = zone->offset_at(absl::FromUnixSeconds(seconds));
            if (resolved != *offset) {
                return make_error(ErrorCode::invalid_argument,
                                  fmt::format("offset {} does not match time zone {} ({}) at {}",
                                              offset->to_string(), zone->name(),
                                              resolved.to_string(), absl::FormatCivilTime(civil)));
            }
            int64_t micros = detail::add_micros(
                detail::mul_micros(seconds, detail::MICROS_PER_SEC), time.microsecond());
            return from_unix_micros(micros, Anchor{*std::move(zone)});
        }
        if (zone) {
            return from_wall_clock(civil, time.microsecond(), Anchor{*std::move(zone)});
        }
        TimeOffset fixed = offset.value_or(TimeOffset::utc());
        return DateTime(date, time, Anchor{fixed}, fixed);
    }

    /**
     * @brief Validate and construct a civil instant in a named zone
     * @return ErrorCode::invalid_argument for an invalid date or time of day,
     *         ErrorCode::unknown_zone when the zone name cannot be resolved
     */
    static Result<DateTime> create(int64_t year, int month, int day, int hour, int minute,
                                   int second, int microsecond = 0,
                                   std::string_view zone_name = "UTC") {
        auto date = Date::create(year, month, day);
        if (!date) {
            return unexpected(date.error());
        }
        auto time = Time::create(hour, minute, second, microsecond);
        if (!time) {
            return unexpected(time.error());
        }
        auto zone = TimeZone::create(zone_name);
        if (!zone) {
            return unexpected(zone.error());
        }
        return make(*date, *time, *std::move(zone));
    }

    /// UTC instant `seconds` after 1970-01-01T00:00:00Z (negative for earlier)
    static DateTime from_timestamp_unix(int64_t seconds) {
        return from_unix_micros(detail::mul_micros(seconds, detail::MICROS_PER_SEC),
                                Anchor{TimeZone::utc()});
    }

    static DateTime from_timestamp_unix(TimeUnit timestamp) {
        return from_unix_micros(timestamp.total_microseconds(), Anchor{TimeZone::utc()});
    }

    /**
     * @brief Parse an ISO-8601 date-time
     *
     * `2020-06-01T12:00:00+02:00` keeps the zone unset;
     * `2020-06-01T12:00:00+02:00[Europe/Warsaw]` sets it and cross-checks the offset.
     * A string with neither is read as UTC.
     */
    static Result<DateTime> from_string(std::string_view text) {
        auto fields = detail::Iso8601Parser(text).parse();
        if (!fields) {
            return unexpected(fields.error());
        }
        auto date = Date::create(fields->year, fields->month, fields->day);
        if (!date) {
            return unexpected(date.error());
        }
        auto time = Time::create(fields->hour, fields->minute, fields->second, fields->microsecond);
        if (!time) {
            return unexpected(time.error());
        }
        std::optional<TimeZone> zone;
        if (fields->zone) {
            auto resolved = TimeZone::create(*fields->zone);
            if (!resolved) {
                return unexpected(resolved.error());
            }
            zone = *std::move(resolved);
        }
        return make(*date, *time, std::move(zone), fields->offset);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    const Date& date() const noexcept { return date_; }
    const Time& time() const noexcept { return time_; }

    int64_t year() const noexcept { return date_.year(); }
    int month() const noexcept { return date_.month(); }
    int day() const noexcept { return date_.day(); }
    int hour() const noexcept { return time_.hour(); }
    int minute() const noexcept { return time_.minute(); }
    int second() const noexcept { return time_.second(); }
    int microsecond() const noexcept { return time_.microsecond(); }

    /// Named zone, empty for offset-only values
    std::optional<TimeZone> time_zone() const {
        if (const auto* zone = std::get_if<TimeZone>(&anchor_)) {
            return *zone;
        }
        return std::nullopt;
    }

    const TimeOffset& time_offset() const noexcept { return offset_; }

    const Anchor& anchor() const noexcept { return anchor_; }

    /// Daylight-saving time in effect (always false without a named zone)
    bool is_daylight() const {
        if (const auto* zone = std::get_if<TimeZone>(&anchor_)) {
            return zone->is_dst_at(to_absl_time());
        }
        return false;
    }

    /// Standard time in effect, the complement of is_daylight()
    bool is_saving_time() const { return !is_daylight(); }

    // ========================================================================
    // Rendering
    // ========================================================================

    /// `YYYY-MM-DDTHH:MM:SS±HH:MM`, with `.ffffff` before the offset when requested
    std::string to_iso8601(bool with_microseconds = false) const {
        int64_t y = date_.year();
        std::string text = fmt::format("{:0{}}-{:02}-{:02}T{:02}:{:02}:{:02}", y, y < 0 ? 5 : 4,
                                       date_.month(), date_.day(), time_.hour(), time_.minute(),
                                       time_.second());
        if (with_microseconds) {
            text += fmt::format(".{:06}", time_.microsecond());
        }
        text += offset_.to_string();
        return text;
    }

    std::string to_string() const { return to_iso8601(time_.microsecond() != 0); }

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Shift by `count` units
     *
     * day/week/month/year move the wall clock (month and year clamp the day to
     * the end of the target month) and re-resolve the zone at the new civil
     * time. hour and smaller units move the absolute instant.
     */
    DateTime modify(CalendarUnit unit, int64_t count) const {
        switch (unit) {
            case CalendarUnit::microsecond:
                return add(TimeUnit::microseconds(count));
            case CalendarUnit::second:
                return add(TimeUnit::seconds(count));
            case CalendarUnit::minute:
                return add(TimeUnit::minutes(count));
            case CalendarUnit::hour:
                return add(TimeUnit::hours(count));
            case CalendarUnit::day:
                return with_date(date_.add_days(count));
            case CalendarUnit::week:
                return with_date(date_.add_days(detail::mul_saturating(count, DAYS_PER_WEEK)));
            case CalendarUnit::month:
                return with_date(date_.add_months(count));
            case CalendarUnit::year:
                return with_date(date_.add_months(detail::mul_saturating(count, MONTHS_PER_YEAR)));
        }
        return *this;
    }

    DateTime add_hour() const { return modify(CalendarUnit::hour, 1); }
    DateTime add_hours(int64_t n) const { return modify(CalendarUnit::hour, n); }
    DateTime sub_hour() const { return modify(CalendarUnit::hour, -1); }
    DateTime sub_hours(int64_t n) const { return modify(CalendarUnit::hour, -n); }
    DateTime add_minute() const { return modify(CalendarUnit::minute, 1); }
    DateTime add_minutes(int64_t n) const { return modify(CalendarUnit::minute, n); }
    DateTime sub_minute() const { return modify(CalendarUnit::minute, -1); }
    DateTime sub_minutes(int64_t n) const { return modify(CalendarUnit::minute, -n); }
    DateTime add_second() const { return modify(CalendarUnit::second, 1); }
    DateTime add_seconds(int64_t n) const { return modify(CalendarUnit::second, n); }
    DateTime sub_second() const { return modify(CalendarUnit::second, -1); }
    DateTime sub_seconds(int64_t n) const { return modify(CalendarUnit::second, -n); }
    DateTime add_day() const { return modify(CalendarUnit::day, 1); }
    DateTime add_days(int64_t n) const { return modify(CalendarUnit::day, n); }
    DateTime sub_day() const { return modify(CalendarUnit::day, -1); }
    DateTime sub_days(int64_t n) const { return modify(CalendarUnit::day, -n); }
    DateTime add_week() const { return modify(CalendarUnit::week, 1); }
    DateTime add_weeks(int64_t n) const { return modify(CalendarUnit::week, n); }
    DateTime sub_week() const { return modify(CalendarUnit::week, -1); }
    DateTime sub_weeks(int64_t n) const { return modify(CalendarUnit::week, -n); }
    DateTime add_month() const { return modify(CalendarUnit::month, 1); }
    DateTime add_months(int64_t n) const { return modify(CalendarUnit::month, n); }
    DateTime sub_month() const { return modify(CalendarUnit::month, -1); }
    DateTime sub_months(int64_t n) const { return modify(CalendarUnit::month, -n); }
    DateTime add_year() const { return modify(CalendarUnit::year, 1); }
    DateTime add_years(int64_t n) const { return modify(CalendarUnit::year, n); }
    DateTime sub_year() const { return modify(CalendarUnit::year, -1); }
    DateTime sub_years(int64_t n) const { return modify(CalendarUnit::year, -n); }

    /// Move the absolute instant by `unit`
    DateTime add(TimeUnit unit) const {
        return from_unix_micros(detail::add_micros(unix_microseconds(), unit.total_microseconds()),
                                anchor_);
    }

    DateTime sub(TimeUnit unit) const {
        return from_unix_micros(detail::sub_micros(unix_microseconds(), unit.total_microseconds()),
                                anchor_);
    }

    DateTime midnight() const { return with_time(Time::midnight()); }
    DateTime noon() const { return with_time(Time::noon()); }
    DateTime end_of_day() const { return with_time(Time::end_of_day()); }

    // ========================================================================
    // Re-anchoring (same instant, different civil fields)
    // ========================================================================

    DateTime to_time_zone(const TimeZone& zone) const {
        return from_unix_micros(unix_microseconds(), Anchor{zone});
    }

    DateTime to_time_offset(TimeOffset offset) const {
        return from_unix_micros(unix_microseconds(), Anchor{offset});
    }

    // ========================================================================
    // Comparison (absolute instants)
    // ========================================================================

    bool is_equal(const DateTime& other) const noexcept {
        return unix_microseconds() == other.unix_microseconds();
    }
    bool is_before(const DateTime& other) const noexcept {
        return unix_microseconds() < other.unix_microseconds();
    }
    bool is_before_or_equal(const DateTime& other) const noexcept {
        return unix_microseconds() <= other.unix_microseconds();
    }
    bool is_after(const DateTime& other) const noexcept {
        return unix_microseconds() > other.unix_microseconds();
    }
    bool is_after_or_equal(const DateTime& other) const noexcept {
        return unix_microseconds() >= other.unix_microseconds();
    }

    // ========================================================================
    // Timestamps
    // ========================================================================

    /// Leap-second free time since 1970-01-01T00:00:00Z, signed
    TimeUnit timestamp_unix() const noexcept { return TimeUnit::microseconds(unix_microseconds()); }

    int64_t unix_microseconds() const noexcept {
        int64_t seconds = (to_civil(date_, time_) - absl::CivilSecond(1970, 1, 1, 0, 0, 0)) -
                          offset_.total_seconds();
        return detail::add_micros(detail::mul_micros(seconds, detail::MICROS_PER_SEC),
                                  time_.microsecond());
    }

    absl::Time to_absl_time() const { return absl::FromUnixMicros(unix_microseconds()); }

    // Defined in time_epoch.hpp
    Result<TimeUnit> timestamp(const TimeEpoch& epoch) const;
    Result<TimeUnit> timestamp(const TimeEpoch& epoch, const LeapSeconds& table) const;
    Result<DateTime> to_atomic_time() const;
    DateTime to_atomic_time(const LeapSeconds& table) const;
    Result<DateTime> to_gps_time() const;
    DateTime to_gps_time(const LeapSeconds& table) const;

    // Defined in time_period.hpp
    TimePeriod until(const DateTime& point) const;
    TimePeriod since(const DateTime& point) const;
    TimeUnit distance_until(const DateTime& point) const;
    TimeUnit distance_since(const DateTime& point) const;
    Result<TimePeriods> iterate(const DateTime& point, TimeUnit by) const;

private:
    static constexpr int64_t DAYS_PER_WEEK = 7;
    static constexpr int64_t MONTHS_PER_YEAR = 12;

    Date date_;
    Time time_;
    Anchor anchor_;
    TimeOffset offset_;

    DateTime(Date date, Time time, Anchor anchor, TimeOffset offset)
        : date_(date),
          time_(time),
          anchor_(std::move(anchor)),
          offset_(offset) {}

    static absl::CivilSecond to_civil(const Date& date, const Time& time) noexcept {
        return absl::CivilSecond(date.year(), date.month(), date.day(), time.hour(), time.minute(),
                                 time.second());
    }

    /// Express an absolute instant under an anchor
    static DateTime from_unix_micros(int64_t micros, Anchor anchor) {
        int64_t seconds = detail::floor_div(micros, detail::MICROS_PER_SEC);
        int us = static_cast<int>(detail::floor_mod(micros, detail::MICROS_PER_SEC));
        absl::CivilSecond civil;
        TimeOffset offset;
        if (const auto* zone = std::get_if<TimeZone>(&anchor)) {
            absl::Time instant = absl::FromUnixSeconds(seconds);
            civil = zone->civil_at(instant);
            offset = zone->offset_at(instant);
        } else {
            offset = std::get<TimeOffset>(anchor);
            civil = absl::CivilSecond(1970, 1, 1, 0, 0, 0) + (seconds + offset.total_seconds());
        }
        // Wall clocks outside the supported years saturate to the first or last microsecond
        const absl::CivilSecond lowest(Date::MIN_YEAR, 1, 1, 0, 0, 0);
        const absl::CivilSecond highest(Date::MAX_YEAR, 12, 31, 23, 59, 59);
        if (civil < lowest) {
            civil = lowest;
            us = 0;
        } else if (civil > highest) {
            civil = highest;
            us = static_cast<int>(detail::MAX_MICROS);
        }
        return DateTime(Date::from_civil(absl::CivilDay(civil)), Time::from_civil(civil, us),
                        std::move(anchor), offset);
    }

    /// Express a wall-clock time under an anchor, normalizing skipped wall times
    static DateTime from_wall_clock(absl::CivilSecond civil, int microsecond, Anchor anchor) {
        if (const auto* zone = std::get_if<TimeZone>(&anchor)) {
            int64_t seconds = absl::ToUnixSeconds(zone->resolve(civil));
            int64_t micros =
                detail::add_micros(detail::mul_micros(seconds, detail::MICROS_PER_SEC), microsecond);
            return from_unix_micros(micros, std::move(anchor));
        }
        TimeOffset offset = std::get<TimeOffset>(anchor);
        return DateTime(Date::from_civil(absl::CivilDay(civil)), Time::from_civil(civil, microsecond),
                        std::move(anchor), offset);
    }

    DateTime with_date(Date date) const {
        return from_wall_clock(to_civil(date, time_), time_.microsecond(), anchor_);
    }

    DateTime with_time(Time time) const {
        return from_wall_clock(to_civil(date_, time), time.microsecond(), anchor_);
    }
};

} // namespace tempora
