#pragma once

#include "tempora/date_time.hpp"
#include "tempora/detail/leap_second_list.hpp"
#include "tempora/detail/time_math.hpp"
#include "tempora/error.hpp"
#include "tempora/time_unit.hpp"

#include <algorithm>
#include <charconv>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fmt/format.h>

namespace tempora {

/**
 * @brief One change of the TAI-UTC difference
 *
 * `unix_seconds` is the first UTC second after the change took effect
 * (2017-01-01T00:00:00Z for the leap second inserted at the end of 2016).
 */
struct LeapSecond {
    int64_t unix_seconds{0};
    int32_t delta{0};

    DateTime date() const { return DateTime::from_timestamp_unix(unix_seconds); }

    TimeUnit offset() const noexcept { return TimeUnit::seconds(delta); }

    /// False for the 1972 baseline record, which sets TAI-UTC to 10 s at once
    bool is_leap_second() const noexcept { return delta == 1 || delta == -1; }

    bool operator==(const LeapSecond&) const = default;
};

/**
 * @brief Table of TAI-UTC changes, or a filtered view of one
 *
 * The process-wide table comes from load(), which parses the list compiled
 * into the library on first use and caches the result. from_list() builds an
 * independent table from any text in the IERS leap-seconds.list format, for
 * callers that ship a newer list or need a substitute in tests.
 *
 * Views returned by until(), since() and between() share the parent's record
 * storage and only narrow the index range; nothing is copied or mutated.
 *
 * Record instants are inclusive on both filters: a record at exactly `point`
 * belongs to until(point) and to since(point).
 */
class LeapSeconds {
public:
    using const_iterator = std::vector<LeapSecond>::const_iterator;

    /// IERS lists count seconds from 1900-01-01T00:00:00Z
    static constexpr int64_t NTP_UNIX_DELTA = 2'208'988'800;

    /**
     * @brief The compiled-in table, parsed once per process
     *
     * Concurrent first calls converge on a single parse. Every later call
     * returns a copy of the cached result (the records themselves are shared).
     *
     * @return The table, or ErrorCode::data_error if the compiled-in list is corrupt
     */
    static Result<LeapSeconds> load() {
        static const Result<LeapSeconds> cached = [] {
            auto table = from_list(detail::LEAP_SECOND_LIST);
#ifndef NDEBUG
            if (!table) {
                std::fprintf(stderr, "WARNING: built-in leap second list rejected: %s\n",
                             table.error().what().c_str());
            }
#endif
            return table;
        }();
        return cached;
    }

    /**
     * @brief Parse a list in IERS leap-seconds.list format
     *
     * Data lines are `<NTP seconds> <TAI-UTC>` with an optional `#` comment.
     * `#@ <NTP seconds>` sets the expiry; other `#` lines are ignored.
     *
     * @return ErrorCode::data_error for an unparseable line, instants out of
     *         order or repeated, or a step other than +-1 second after the
     *         first record
     */
    static Result<LeapSeconds> from_list(std::string_view text) {
        auto data = std::make_shared<Data>();
        int32_t previous_tai_utc = 0;
        std::size_t line_number = 0;

        while (!text.empty()) {
            std::size_t eol = text.find('\n');
            std::string_view line = text.substr(0, eol);
            text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
            ++line_number;

            if (line.starts_with("#@")) {
                std::string_view rest = line.substr(2);
                int64_t ntp = 0;
                if (!next_integer(rest, ntp)) {
                    return corrupt(line_number, "unreadable expiry");
                }
                if (ntp < 0) {
                    return corrupt(line_number, "expiry out of range");
                }
                data->expires = ntp - NTP_UNIX_DELTA;
                continue;
            }
            std::string_view content = line.substr(0, line.find('#'));
            if (is_blank(content)) {
                continue;
            }

            int64_t ntp = 0;
            int64_t tai_utc = 0;
            if (!next_integer(content, ntp) || !next_integer(content, tai_utc) ||
                !is_blank(content)) {
                return corrupt(line_number, "expected \"<NTP seconds> <TAI-UTC>\"");
            }
            // NTP seconds are unsigned
            if (ntp < 0) {
                return corrupt(line_number, "instant out of range");
            }
            if (tai_utc < INT32_MIN || tai_utc > INT32_MAX) {
                return corrupt(line_number, "TAI-UTC out of range");
            }
            int64_t instant = ntp - NTP_UNIX_DELTA;
            if (!data->records.empty() && instant <= data->records.back().unix_seconds) {
                return corrupt(line_number, "instants are not strictly increasing");
            }
            int64_t delta = tai_utc - previous_tai_utc;
            if (!data->records.empty() && delta != 1 && delta != -1) {
                return corrupt(line_number,
                               fmt::format("TAI-UTC changes by {} s; leap seconds are +-1 s", delta));
            }
            data->records.push_back(LeapSecond{instant, static_cast<int32_t>(delta)});
            previous_tai_utc = static_cast<int32_t>(tai_utc);
        }

        std::size_t size = data->records.size();
        return LeapSeconds(std::move(data), 0, size);
    }

    /// Empty table
    LeapSeconds() : data_(std::make_shared<Data>()) {}

    // ========================================================================
    // Filtering
    // ========================================================================

    /// Records effective at or before `point`
    LeapSeconds until(const DateTime& point) const {
        auto it = std::upper_bound(begin(), end(), point.unix_microseconds(),
                                   [](int64_t micros, const LeapSecond& record) {
                                       return micros < record_micros(record);
                                   });
        return LeapSeconds(data_, first_, index_of(it));
    }

    /// Records effective at or after `point`
    LeapSeconds since(const DateTime& point) const {
        auto it = std::lower_bound(begin(), end(), point.unix_microseconds(),
                                   [](const LeapSecond& record, int64_t micros) {
                                       return record_micros(record) < micros;
                                   });
        return LeapSeconds(data_, index_of(it), last_);
    }

    /// Records within [a, b] (or [b, a]), inclusive
    LeapSeconds between(const DateTime& a, const DateTime& b) const {
        return a.is_before(b) ? since(a).until(b) : since(b).until(a);
    }

    // ========================================================================
    // Aggregates
    // ========================================================================

    /// Sum of the TAI-UTC changes in this view
    TimeUnit offset_tai() const noexcept {
        int64_t total = 0;
        for (const auto& record : *this) {
            total += record.delta;
        }
        return TimeUnit::seconds(total);
    }

    /// Number of +-1 s leap seconds in this view (the 1972 baseline is not one)
    std::size_t count() const noexcept {
        return static_cast<std::size_t>(
            std::count_if(begin(), end(), [](const LeapSecond& r) { return r.is_leap_second(); }));
    }

    std::size_t size() const noexcept { return last_ - first_; }
    bool empty() const noexcept { return first_ == last_; }

    const_iterator begin() const noexcept {
        return data_->records.begin() + static_cast<std::ptrdiff_t>(first_);
    }
    const_iterator end() const noexcept {
        return data_->records.begin() + static_cast<std::ptrdiff_t>(last_);
    }

    const LeapSecond& operator[](std::size_t index) const noexcept {
        return data_->records[first_ + index];
    }

    /// Instant after which the list may be missing announced leap seconds
    std::optional<DateTime> expires() const {
        if (!data_->expires) {
            return std::nullopt;
        }
        return DateTime::from_timestamp_unix(*data_->expires);
    }

private:
    struct Data {
        std::vector<LeapSecond> records;
        std::optional<int64_t> expires;
    };

    std::shared_ptr<const Data> data_;
    std::size_t first_{0};
    std::size_t last_{0};

    LeapSeconds(std::shared_ptr<const Data> data, std::size_t first, std::size_t last)
        : data_(std::move(data)),
          first_(first),
          last_(last) {}

    std::size_t index_of(const_iterator it) const noexcept {
        return static_cast<std::size_t>(it - data_->records.begin());
    }

    static int64_t record_micros(const LeapSecond& record) noexcept {
        return detail::mul_micros(record.unix_seconds, detail::MICROS_PER_SEC);
    }

    static bool is_blank(std::string_view s) noexcept {
        return s.find_first_not_of(" \t\r") == std::string_view::npos;
    }

    // Consume leading whitespace and one decimal integer
    static bool next_integer(std::string_view& s, int64_t& out) noexcept {
        std::size_t start = s.find_first_not_of(" \t");
        if (start == std::string_view::npos) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(s.data() + start, s.data() + s.size(), out);
        if (ec != std::errc()) {
            return false;
        }
        s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
        return true;
    }

    static unexpected<Error> corrupt(std::size_t line_number, std::string_view reason) {
        return make_error(ErrorCode::data_error,
                          fmt::format("leap second list line {}: {}", line_number, reason));
    }
};

} // namespace tempora
