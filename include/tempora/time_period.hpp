#pragma once

#include "tempora/date_time.hpp"
#include "tempora/error.hpp"
#include "tempora/leap_seconds.hpp"
#include "tempora/time_unit.hpp"

#include <compare>
#include <iterator>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <fmt/format.h>

namespace tempora {

/**
 * @brief Finite sequence of instants a fixed step apart
 *
 * Element k is computed directly as origin + k * step, so the sequence holds
 * no cursor state: it can be indexed in any order, iterated repeatedly and
 * shared between threads. The step is signed and already points from the
 * origin toward the closing endpoint; no element lies beyond that endpoint.
 */
class TimePeriods {
public:
    class iterator {
    public:
        using iterator_concept = std::random_access_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = DateTime;
        using difference_type = std::ptrdiff_t;
        using reference = DateTime;

        iterator() = default;

        DateTime operator*() const { return (*owner_)[index_]; }
        DateTime operator[](difference_type n) const {
            return (*owner_)[static_cast<std::size_t>(static_cast<difference_type>(index_) + n)];
        }

        iterator& operator++() {
            ++index_;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++index_;
            return tmp;
        }
        iterator& operator--() {
            --index_;
            return *this;
        }
        iterator operator--(int) {
            iterator tmp = *this;
            --index_;
            return tmp;
        }
        iterator& operator+=(difference_type n) {
            index_ = static_cast<std::size_t>(static_cast<difference_type>(index_) + n);
            return *this;
        }
        iterator& operator-=(difference_type n) { return *this += -n; }

        friend iterator operator+(iterator it, difference_type n) { return it += n; }
        friend iterator operator+(difference_type n, iterator it) { return it += n; }
        friend iterator operator-(iterator it, difference_type n) { return it -= n; }
        friend difference_type operator-(const iterator& a, const iterator& b) {
            return static_cast<difference_type>(a.index_) - static_cast<difference_type>(b.index_);
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept {
            return a.index_ == b.index_;
        }
        friend auto operator<=>(const iterator& a, const iterator& b) noexcept {
            return a.index_ <=> b.index_;
        }

    private:
        friend class TimePeriods;

        const TimePeriods* owner_{nullptr};
        std::size_t index_{0};

        iterator(const TimePeriods* owner, std::size_t index) : owner_(owner), index_(index) {}
    };

    TimePeriods(DateTime origin, TimeUnit step, std::size_t count)
        : origin_(std::move(origin)),
          step_(step),
          count_(count) {}

    std::size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    /// Signed step between consecutive elements
    TimeUnit step() const noexcept { return step_; }

    DateTime operator[](std::size_t index) const {
        return origin_.add(step_ * static_cast<int64_t>(index));
    }

    DateTime front() const { return origin_; }
    DateTime back() const { return (*this)[count_ - 1]; }

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count_); }

    std::vector<DateTime> to_vector() const {
        std::vector<DateTime> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

private:
    DateTime origin_;
    TimeUnit step_;
    std::size_t count_;
};

/**
 * @brief Interval between two instants
 *
 * start() may lie after end(); distance() is always non-negative and the
 * direction is reported by is_forward()/is_backward().
 */
class TimePeriod {
public:
    TimePeriod(DateTime start, DateTime end) : start_(std::move(start)), end_(std::move(end)) {}

    const DateTime& start() const noexcept { return start_; }
    const DateTime& end() const noexcept { return end_; }

    /// Absolute leap-second free time between the endpoints
    TimeUnit distance() const noexcept {
        return (end_.timestamp_unix() - start_.timestamp_unix()).abs();
    }

    bool is_forward() const noexcept { return start_.is_before_or_equal(end_); }
    bool is_backward() const noexcept { return end_.is_before(start_); }

    const DateTime& earliest() const noexcept { return is_forward() ? start_ : end_; }
    const DateTime& latest() const noexcept { return is_forward() ? end_ : start_; }

    /// Inclusive of both endpoints
    bool contains(const DateTime& point) const noexcept {
        return earliest().is_before_or_equal(point) && latest().is_after_or_equal(point);
    }

    /// Share more than a single instant
    bool overlaps(const TimePeriod& other) const noexcept {
        return earliest().is_before(other.latest()) && other.earliest().is_before(latest());
    }

    /// One ends exactly where the other begins
    bool abuts(const TimePeriod& other) const noexcept {
        return latest().is_equal(other.earliest()) || other.latest().is_equal(earliest());
    }

    /// Leap second records between the endpoints, inclusive
    LeapSeconds leap_seconds(const LeapSeconds& table) const { return table.between(start_, end_); }

    Result<LeapSeconds> leap_seconds() const {
        auto table = LeapSeconds::load();
        if (!table) {
            return unexpected(table.error());
        }
        return leap_seconds(*table);
    }

    /// Step |by| from start() toward end()
    Result<TimePeriods> iterate(TimeUnit by) const { return steps(start_, end_, by); }

    /// Step |by| from end() toward start()
    Result<TimePeriods> iterate_backward(TimeUnit by) const { return steps(end_, start_, by); }

private:
    DateTime start_;
    DateTime end_;

    static Result<TimePeriods> steps(const DateTime& origin, const DateTime& target, TimeUnit by) {
        if (by.is_zero()) {
            return make_error(ErrorCode::invalid_argument,
                              fmt::format("cannot iterate from {} to {} in steps of zero",
                                          origin.to_iso8601(), target.to_iso8601()));
        }
        TimeUnit magnitude = by.abs();
        TimeUnit span = (target.timestamp_unix() - origin.timestamp_unix()).abs();
        auto count = static_cast<std::size_t>(span / magnitude) + 1;
        TimeUnit step = target.is_before(origin) ? -magnitude : magnitude;
        return TimePeriods(origin, step, count);
    }
};

// ============================================================================
// DateTime interval operations
// ============================================================================

inline TimePeriod DateTime::until(const DateTime& point) const { return TimePeriod(*this, point); }

inline TimePeriod DateTime::since(const DateTime& point) const { return TimePeriod(point, *this); }

inline TimeUnit DateTime::distance_until(const DateTime& point) const {
    return until(point).distance();
}

inline TimeUnit DateTime::distance_since(const DateTime& point) const {
    return since(point).distance();
}

/**
 * Steps of |by| from this instant toward `point`: backward when `point` is
 * earlier, forward otherwise.
 */
inline Result<TimePeriods> DateTime::iterate(const DateTime& point, TimeUnit by) const {
    TimePeriod period = until(point);
    return period.iterate(by);
}

} // namespace tempora
