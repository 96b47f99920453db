#pragma once

#include "tempora/detail/time_math.hpp"

#include <compare>
#include <limits>
#include <optional>
#include <string>

#include <cmath>
#include <cstdint>
#include <fmt/format.h>

namespace tempora {

/**
 * Signed time interval with exact microsecond precision.
 *
 * ## Storage
 * A single int64_t count of microseconds. The sign is carried once: there is
 * no separately signed fraction. Accessors present the value in
 * sign-magnitude form:
 * - `-1.5 seconds` has in_seconds() == -1 and microsecond() == 500000
 * - `+1.5 seconds` has in_seconds() ==  1 and microsecond() == 500000
 *
 * ## Range
 * Approximately ±292,000 years.
 *
 * ## Overflow Policy
 * All arithmetic saturates to min()/max() on overflow:
 * - No exceptions are thrown
 * - Use `saturated(unit)` helper to detect overflow when needed
 *
 * This is a core library type: noexcept, no allocation.
 */
class TimeUnit {
public:
    static constexpr int64_t MICROSECONDS_PER_SECOND = detail::MICROS_PER_SEC;
    static constexpr int64_t MICROSECONDS_PER_MILLISECOND = 1'000;

    // Named constants
    static constexpr TimeUnit min() noexcept {
        return TimeUnit(std::numeric_limits<int64_t>::min());
    }

    static constexpr TimeUnit max() noexcept {
        return TimeUnit(std::numeric_limits<int64_t>::max());
    }

    static constexpr TimeUnit zero() noexcept { return TimeUnit(0); }

    // Default construction - zero interval
    constexpr TimeUnit() noexcept = default;

    // Direct factories - saturate on overflow (consistent with arithmetic)
    static constexpr TimeUnit microseconds(int64_t us) noexcept { return TimeUnit(us); }

    static constexpr TimeUnit milliseconds(int64_t ms) noexcept {
        return TimeUnit(detail::mul_micros(ms, MICROSECONDS_PER_MILLISECOND));
    }

    static constexpr TimeUnit seconds(int64_t s) noexcept {
        return TimeUnit(detail::mul_micros(s, MICROSECONDS_PER_SECOND));
    }

    static constexpr TimeUnit minutes(int64_t m) noexcept {
        return seconds(detail::mul_saturating(m, detail::SECONDS_PER_MINUTE));
    }

    static constexpr TimeUnit hours(int64_t h) noexcept {
        return seconds(detail::mul_saturating(h, detail::SECONDS_PER_HOUR));
    }

    static constexpr TimeUnit days(int64_t d) noexcept {
        return seconds(detail::mul_saturating(d, detail::SECONDS_PER_DAY));
    }

    /// Non-negative interval from magnitude parts (microsecond taken modulo one second)
    static constexpr TimeUnit positive(int64_t seconds, int64_t microsecond = 0) noexcept {
        return TimeUnit(detail::compose_micros(false, magnitude(seconds),
                                               magnitude(microsecond) % MICROSECONDS_PER_SECOND));
    }

    /// Non-positive interval from magnitude parts: negative(1, 500000) is -1.5 s
    static constexpr TimeUnit negative(int64_t seconds, int64_t microsecond = 0) noexcept {
        return TimeUnit(detail::compose_micros(true, magnitude(seconds),
                                               magnitude(microsecond) % MICROSECONDS_PER_SECOND));
    }

    // Checked factory from double - returns nullopt on overflow or invalid input
    static std::optional<TimeUnit> precise(double s) noexcept {
        if (!std::isfinite(s)) {
            return std::nullopt;
        }
        double us = std::round(s * static_cast<double>(MICROSECONDS_PER_SECOND));
        // 2^63 is exactly representable; anything at or beyond it cannot be cast
        constexpr double limit = 9223372036854775808.0;
        if (us >= limit || us < -limit) {
            return std::nullopt;
        }
        return TimeUnit(static_cast<int64_t>(us));
    }

    // Primary accessors - sign-magnitude view
    /// Whole seconds, truncated toward zero and carrying the sign
    constexpr int64_t in_seconds() const noexcept {
        return detail::split_micros(micros_).first;
    }

    /// Microsecond fraction of the magnitude, always in [0, 10^6)
    constexpr int64_t microsecond() const noexcept {
        return detail::split_micros(micros_).second;
    }

    constexpr int64_t total_microseconds() const noexcept { return micros_; }

    constexpr int64_t in_milliseconds() const noexcept {
        return micros_ / MICROSECONDS_PER_MILLISECOND;
    }

    constexpr int64_t in_minutes() const noexcept {
        return in_seconds() / detail::SECONDS_PER_MINUTE;
    }

    constexpr int64_t in_hours() const noexcept { return in_seconds() / detail::SECONDS_PER_HOUR; }

    constexpr int64_t in_days() const noexcept { return in_seconds() / detail::SECONDS_PER_DAY; }

    constexpr double to_seconds() const noexcept {
        return static_cast<double>(micros_) / static_cast<double>(MICROSECONDS_PER_SECOND);
    }

    /// Exact decimal rendering, e.g. "-1.500000"
    std::string in_seconds_precise() const {
        auto [sec, frac] = detail::split_micros(micros_);
        const char* sign = (micros_ < 0 && sec == 0) ? "-" : "";
        return fmt::format("{}{}.{:06}", sign, sec, frac);
    }

    // Predicates
    constexpr bool is_zero() const noexcept { return micros_ == 0; }
    constexpr bool is_negative() const noexcept { return micros_ < 0; }
    /// True for zero as well: zero counts as non-negative
    constexpr bool is_positive() const noexcept { return micros_ >= 0; }

    // Absolute value (saturates for min())
    constexpr TimeUnit abs() const noexcept { return is_negative() ? -(*this) : *this; }

    /// Same magnitude, opposite sign
    constexpr TimeUnit invert() const noexcept { return -(*this); }

    // Unary negation (saturates for min())
    constexpr TimeUnit operator-() const noexcept {
        if (micros_ == std::numeric_limits<int64_t>::min()) {
            return max();
        }
        return TimeUnit(-micros_);
    }

    // Arithmetic operators (saturate on overflow)
    constexpr TimeUnit& operator+=(TimeUnit other) noexcept {
        micros_ = detail::add_micros(micros_, other.micros_);
        return *this;
    }

    constexpr TimeUnit& operator-=(TimeUnit other) noexcept {
        micros_ = detail::sub_micros(micros_, other.micros_);
        return *this;
    }

    constexpr TimeUnit& operator*=(int64_t scalar) noexcept {
        micros_ = detail::mul_micros(micros_, scalar);
        return *this;
    }

    constexpr TimeUnit& operator/=(int64_t scalar) noexcept {
        micros_ = detail::div_micros(micros_, scalar);
        return *this;
    }

    friend constexpr TimeUnit operator+(TimeUnit lhs, TimeUnit rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr TimeUnit operator-(TimeUnit lhs, TimeUnit rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    friend constexpr TimeUnit operator*(TimeUnit u, int64_t scalar) noexcept {
        u *= scalar;
        return u;
    }

    friend constexpr TimeUnit operator*(int64_t scalar, TimeUnit u) noexcept {
        u *= scalar;
        return u;
    }

    friend constexpr TimeUnit operator/(TimeUnit u, int64_t scalar) noexcept {
        u /= scalar;
        return u;
    }

    // Division of units yields an exact integral ratio (truncated toward zero)
    friend constexpr int64_t operator/(TimeUnit lhs, TimeUnit rhs) noexcept {
        return detail::div_micros(lhs.micros_, rhs.micros_);
    }

    // Remainder after removing whole multiples of rhs; sign follows lhs
    friend constexpr TimeUnit operator%(TimeUnit lhs, TimeUnit rhs) noexcept {
        if (rhs.is_zero() || rhs.micros_ == -1) {
            return zero();
        }
        return TimeUnit(lhs.micros_ % rhs.micros_);
    }

    // Comparison
    constexpr auto operator<=>(const TimeUnit&) const noexcept = default;

private:
    int64_t micros_{0};

    constexpr explicit TimeUnit(int64_t micros) noexcept : micros_(micros) {}

    static constexpr int64_t magnitude(int64_t v) noexcept {
        if (v == std::numeric_limits<int64_t>::min()) {
            return std::numeric_limits<int64_t>::max();
        }
        return v < 0 ? -v : v;
    }
};

/**
 * Check if a TimeUnit has saturated to min() or max().
 *
 * Note: This cannot distinguish between a legitimate max/min value and
 * overflow saturation. With a ±292,000 year range, legitimate max/min is rare.
 */
constexpr bool saturated(const TimeUnit& u) noexcept {
    return u == TimeUnit::max() || u == TimeUnit::min();
}

} // namespace tempora
