#pragma once

#include "tempora/error.hpp"
#include "tempora/time_offset.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

#include <cstdint>
#include <fmt/format.h>

namespace tempora::detail {

/**
 * Fields of an ISO-8601 date-time string, before calendar validation.
 *
 * Range checks (month 13, February 30th, hour 24) are left to Date::create and
 * Time::create so that the error text names the offending value.
 */
struct Iso8601Fields {
    int64_t year{1970};
    int month{1};
    int day{1};
    int hour{0};
    int minute{0};
    int second{0};
    int microsecond{0};
    std::optional<TimeOffset> offset;
    std::optional<std::string> zone;
};

class Iso8601Parser {
public:
    explicit Iso8601Parser(std::string_view text) noexcept : text_(text) {}

    /**
     * Accepted forms:
     *   YYYY-MM-DD
     *   YYYY-MM-DD(T| )HH:MM[:SS[.ffffff]]
     * followed by an optional `Z` / `±HH:MM` / `±HHMM` / `±HH` and an optional
     * `[Area/Location]` zone suffix. The year may carry a leading `-` and
     * more than four digits.
     */
    Result<Iso8601Fields> parse() {
        Iso8601Fields f;
        bool negative_year = accept('-');
        if (!number(4, 6, f.year) || !accept('-') || !number(2, 2, f.month) || !accept('-') ||
            !number(2, 2, f.day)) {
            return fail("expected YYYY-MM-DD");
        }
        if (negative_year) {
            f.year = -f.year;
        }
        if (at_end()) {
            return f;
        }

        if (accept('T') || accept('t') || accept(' ')) {
            if (!number(2, 2, f.hour) || !accept(':') || !number(2, 2, f.minute)) {
                return fail("expected HH:MM after the date");
            }
            if (accept(':')) {
                if (!number(2, 2, f.second)) {
                    return fail("expected seconds after HH:MM:");
                }
                if (accept('.') || accept(',')) {
                    if (!fraction(f.microsecond)) {
                        return fail("expected 1 to 6 fractional digits");
                    }
                }
            }
        }

        if (!at_end() && peek() != '[') {
            std::size_t start = pos_;
            while (!at_end() && peek() != '[') {
                ++pos_;
            }
            auto offset = TimeOffset::from_string(text_.substr(start, pos_ - start));
            if (!offset) {
                return unexpected(offset.error());
            }
            f.offset = *offset;
        }

        if (accept('[')) {
            std::size_t close = text_.find(']', pos_);
            if (close == std::string_view::npos || close == pos_) {
                return fail("unterminated zone suffix");
            }
            f.zone = std::string(text_.substr(pos_, close - pos_));
            pos_ = close + 1;
        }

        if (!at_end()) {
            return fail(fmt::format("unexpected trailing text \"{}\"", text_.substr(pos_)));
        }
        return f;
    }

private:
    std::string_view text_;
    std::size_t pos_{0};

    bool at_end() const noexcept { return pos_ >= text_.size(); }
    char peek() const noexcept { return text_[pos_]; }

    bool accept(char c) noexcept {
        if (!at_end() && peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    template <typename Int>
    bool number(std::size_t min_digits, std::size_t max_digits, Int& out) noexcept {
        std::size_t start = pos_;
        while (!at_end() && pos_ - start < max_digits && peek() >= '0' && peek() <= '9') {
            ++pos_;
        }
        if (pos_ - start < min_digits) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, out);
        return ec == std::errc() && ptr == text_.data() + pos_;
    }

    // Scaled to microseconds: ".5" is 500000
    bool fraction(int& out) noexcept {
        std::size_t start = pos_;
        int value = 0;
        while (!at_end() && peek() >= '0' && peek() <= '9') {
            if (pos_ - start == 6) {
                return false;
            }
            value = value * 10 + (peek() - '0');
            ++pos_;
        }
        std::size_t digits = pos_ - start;
        if (digits == 0) {
            return false;
        }
        for (std::size_t i = digits; i < 6; ++i) {
            value *= 10;
        }
        out = value;
        return true;
    }

    unexpected<Error> fail(std::string_view reason) const {
        return make_error(ErrorCode::invalid_argument,
                          fmt::format("\"{}\" is not an ISO-8601 date-time: {}", text_, reason));
    }
};

} // namespace tempora::detail
