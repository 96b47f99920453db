// include/tempora/detail/time_math.hpp
#pragma once

#include <limits>
#include <utility>

#include <cstdint>

namespace tempora::detail {

/**
 * Centralized time arithmetic for TimeUnit and DateTime.
 *
 * All quantities are signed 64-bit counts of microseconds, which covers
 * roughly ±292,000 years and therefore every instant a DateTime can hold.
 *
 * Overflow policy:
 * - All operations saturate to INT64_MIN/INT64_MAX on overflow (no exceptions, no expected<>)
 * - Callers needing overflow detection should use saturated() helper after operations
 */

/// Microseconds per second (10^6)
inline constexpr int64_t MICROS_PER_SEC = 1'000'000;

/// Maximum valid microsecond fraction (one less than a full second)
inline constexpr int64_t MAX_MICROS = MICROS_PER_SEC - 1;

inline constexpr int64_t SECONDS_PER_MINUTE = 60;
inline constexpr int64_t SECONDS_PER_HOUR = 3'600;
inline constexpr int64_t SECONDS_PER_DAY = 86'400;

/**
 * Add two microsecond counts, saturating on overflow.
 */
constexpr int64_t add_micros(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        return b > 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
    }
    return result;
}

/**
 * Subtract two microsecond counts, saturating on overflow.
 */
constexpr int64_t sub_micros(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_sub_overflow(a, b, &result)) {
        return b < 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
    }
    return result;
}

/**
 * Multiply two signed counts of any unit, saturating on overflow.
 *
 * @return Product, or INT64_MIN/INT64_MAX according to the sign of the true product
 */
constexpr int64_t mul_saturating(int64_t a, int64_t b) noexcept {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        bool negative = (a < 0) != (b < 0);
        return negative ? std::numeric_limits<int64_t>::min()
                        : std::numeric_limits<int64_t>::max();
    }
    return result;
}

/**
 * Multiply a microsecond count by a scalar, saturating on overflow.
 */
constexpr int64_t mul_micros(int64_t micros, int64_t scalar) noexcept {
    return mul_saturating(micros, scalar);
}

/**
 * Divide a microsecond count by a scalar (truncating toward zero).
 *
 * Division by zero saturates based on the sign of the numerator.
 * INT64_MIN / -1 saturates to INT64_MAX.
 */
constexpr int64_t div_micros(int64_t micros, int64_t scalar) noexcept {
    if (scalar == 0) {
        if (micros > 0) {
            return std::numeric_limits<int64_t>::max();
        }
        if (micros < 0) {
            return std::numeric_limits<int64_t>::min();
        }
        return 0;
    }
    if (micros == std::numeric_limits<int64_t>::min() && scalar == -1) {
        return std::numeric_limits<int64_t>::max();
    }
    return micros / scalar;
}

/**
 * Floor division: rounds toward negative infinity.
 *
 * Used to map an absolute microsecond count onto whole civil seconds, where
 * -0.5 s belongs to the second starting at -1 s.
 *
 * @param value Dividend
 * @param divisor Divisor (must be positive)
 */
constexpr int64_t floor_div(int64_t value, int64_t divisor) noexcept {
    int64_t q = value / divisor;
    if ((value % divisor) < 0) {
        --q;
    }
    return q;
}

/**
 * Floor modulo matching floor_div(): result is always in [0, divisor).
 */
constexpr int64_t floor_mod(int64_t value, int64_t divisor) noexcept {
    int64_t r = value % divisor;
    if (r < 0) {
        r += divisor;
    }
    return r;
}

/**
 * Split a signed microsecond count into sign-magnitude form.
 *
 * The sign is carried once: -1.5 s splits into {-1, 500000} and +1.5 s into
 * {1, 500000}. The fraction is always the fraction of the magnitude.
 *
 * @return Pair of (whole seconds truncated toward zero, microsecond fraction in [0, 10^6))
 */
constexpr auto split_micros(int64_t micros) noexcept -> std::pair<int64_t, int64_t> {
    int64_t sec = micros / MICROS_PER_SEC;
    int64_t frac = micros % MICROS_PER_SEC;
    return {sec, frac < 0 ? -frac : frac};
}

/**
 * Combine a magnitude (seconds + microsecond fraction) and a sign into a
 * microsecond count, saturating on overflow.
 */
constexpr int64_t compose_micros(bool negative, int64_t seconds, int64_t fraction) noexcept {
    int64_t magnitude = add_micros(mul_micros(seconds, MICROS_PER_SEC), fraction);
    return negative ? -magnitude : magnitude;
}

} // namespace tempora::detail
