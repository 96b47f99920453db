#pragma once

#include "tempora/detail/time_math.hpp"
#include "tempora/error.hpp"
#include "tempora/time_unit.hpp"

#include <compare>
#include <string>
#include <string_view>

#include <cstdint>
#include <fmt/format.h>

namespace tempora {

/**
 * @brief Fixed offset from UTC, independent of any named zone
 *
 * Stored as signed seconds east of UTC. Rendered as `±HH:MM`, or `±HH:MM:SS`
 * when the offset carries seconds (historical local mean time offsets such
 * as Amsterdam's +00:19:32 before 1937).
 *
 * Magnitude is bounded by MAX_SECONDS (18:00), which covers every offset the
 * IANA database has ever recorded.
 */
class TimeOffset {
public:
    static constexpr int32_t MAX_SECONDS = 18 * 3'600;

    /// UTC (+00:00)
    static constexpr TimeOffset utc() noexcept { return TimeOffset(0); }

    constexpr TimeOffset() noexcept = default;

    static Result<TimeOffset> from_seconds(int64_t seconds) {
        if (seconds > MAX_SECONDS || seconds < -MAX_SECONDS) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("UTC offset of {} seconds is out of range", seconds));
        }
        return TimeOffset(static_cast<int32_t>(seconds));
    }

    /// Whole seconds of the unit are used; a microsecond fraction is rejected
    static Result<TimeOffset> from_time_unit(TimeUnit unit) {
        if (unit.microsecond() != 0) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("UTC offset {} s is not a whole number of seconds",
                                          unit.in_seconds_precise()));
        }
        return from_seconds(unit.in_seconds());
    }

    /**
     * Parse "Z", "±HH:MM", "±HHMM", "±HH" or the "±HH:MM:SS" form to_string()
     * emits for offsets that carry seconds
     */
    static Result<TimeOffset> from_string(std::string_view text) {
        if (text == "Z" || text == "z") {
            return utc();
        }
        auto fail = [&text]() {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("\"{}\" is not a valid UTC offset", text));
        };
        if (text.size() < 3 || (text[0] != '+' && text[0] != '-')) {
            return fail();
        }
        auto digits = [&text](std::size_t pos, int& out) {
            if (pos + 2 > text.size() || !is_digit(text[pos]) || !is_digit(text[pos + 1])) {
                return false;
            }
            out = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
            return true;
        };

        int hours = 0;
        int minutes = 0;
        int seconds = 0;
        if (!digits(1, hours)) {
            return fail();
        }
        if (text.size() == 9 && text[3] == ':' && text[6] == ':') {
            if (!digits(4, minutes) || !digits(7, seconds)) {
                return fail();
            }
        } else if (text.size() == 6 && text[3] == ':') {
            if (!digits(4, minutes)) {
                return fail();
            }
        } else if (text.size() == 5) {
            if (!digits(3, minutes)) {
                return fail();
            }
        } else if (text.size() != 3) {
            return fail();
        }
        if (minutes > 59 || seconds > 59) {
            return fail();
        }

        int64_t total = hours * detail::SECONDS_PER_HOUR + minutes * detail::SECONDS_PER_MINUTE +
                        seconds;
        return from_seconds(text[0] == '-' ? -total : total);
    }

    constexpr int32_t total_seconds() const noexcept { return seconds_; }

    TimeUnit to_time_unit() const noexcept { return TimeUnit::seconds(seconds_); }

    constexpr bool is_utc() const noexcept { return seconds_ == 0; }

    std::string to_string() const {
        int32_t magnitude = seconds_ < 0 ? -seconds_ : seconds_;
        char sign = seconds_ < 0 ? '-' : '+';
        int32_t hh = magnitude / 3'600;
        int32_t mm = (magnitude % 3'600) / 60;
        int32_t ss = magnitude % 60;
        if (ss != 0) {
            return fmt::format("{}{:02}:{:02}:{:02}", sign, hh, mm, ss);
        }
        return fmt::format("{}{:02}:{:02}", sign, hh, mm);
    }

    constexpr auto operator<=>(const TimeOffset&) const noexcept = default;

private:
    int32_t seconds_{0};

    constexpr explicit TimeOffset(int32_t seconds) noexcept : seconds_(seconds) {}

    static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
};

} // namespace tempora
