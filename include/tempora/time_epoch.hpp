#pragma once

#include "tempora/date_time.hpp"
#include "tempora/error.hpp"
#include "tempora/leap_seconds.hpp"
#include "tempora/time_unit.hpp"

#include <cstdint>
#include <fmt/format.h>

namespace tempora {

/**
 * @brief Reference epochs for DateTime::timestamp()
 *
 * | Epoch | Anchor               | Scale                                  |
 * |-------|----------------------|----------------------------------------|
 * | UNIX  | 1970-01-01T00:00:00Z | UTC without leap seconds               |
 * | UTC   | 1972-01-01T00:00:00Z | UTC, leap seconds counted              |
 * | GPS   | 1980-01-06T00:00:00Z | continuous, TAI - 19 s                 |
 * | TAI   | 1958-01-01T00:00:00Z | continuous atomic time                 |
 *
 * UTC is anchored where integral-second UTC begins; before 1972 the TAI-UTC
 * difference drifted by fractions of a second and has no leap second record.
 */
class TimeEpoch {
public:
    enum class Type : uint8_t { unix_time, utc, gps, tai };

    static constexpr TimeEpoch unix_time() noexcept { return TimeEpoch(Type::unix_time); }
    static constexpr TimeEpoch utc() noexcept { return TimeEpoch(Type::utc); }
    static constexpr TimeEpoch gps() noexcept { return TimeEpoch(Type::gps); }
    static constexpr TimeEpoch tai() noexcept { return TimeEpoch(Type::tai); }

    constexpr Type type() const noexcept { return type_; }

    constexpr const char* name() const noexcept {
        switch (type_) {
            case Type::unix_time:
                return "UNIX";
            case Type::utc:
                return "UTC";
            case Type::gps:
                return "GPS";
            case Type::tai:
                return "TAI";
        }
        return "unknown";
    }

    /// Anchor as leap-second free seconds since 1970-01-01T00:00:00Z
    constexpr int64_t anchor_unix_seconds() const noexcept {
        switch (type_) {
            case Type::unix_time:
                return 0;
            case Type::utc:
                return 63'072'000;
            case Type::gps:
                return 315'964'800;
            case Type::tai:
                return -378'691'200;
        }
        return 0;
    }

    DateTime anchor() const { return DateTime::from_timestamp_unix(anchor_unix_seconds()); }

    /// Signed leap-second free distance from this anchor to `other`'s anchor
    constexpr TimeUnit distance_to(const TimeEpoch& other) const noexcept {
        return TimeUnit::seconds(other.anchor_unix_seconds() - anchor_unix_seconds());
    }

    constexpr bool operator==(const TimeEpoch&) const noexcept = default;

private:
    Type type_;

    constexpr explicit TimeEpoch(Type type) noexcept : type_(type) {}
};

// ============================================================================
// DateTime epoch conversions
// ============================================================================

/**
 * Time elapsed since `epoch` started, counted on the epoch's own scale.
 *
 * With L(x) the TAI-UTC offset accumulated up to x:
 * - UNIX: timestamp_unix()
 * - UTC:  timestamp_unix() - UNIX->UTC distance + L(t)
 * - GPS:  timestamp_unix() - UNIX->GPS distance + L(t) - L(GPS anchor)
 * - TAI:  elapsed time since 1958 + TAI-UTC changes in between
 *
 * @return ErrorCode::domain_error if the epoch anchor is after this instant
 */
inline Result<TimeUnit> DateTime::timestamp(const TimeEpoch& epoch,
                                            const LeapSeconds& table) const {
    DateTime anchor = epoch.anchor();
    if (anchor.is_after(*this)) {
        return make_error(ErrorCode::domain_error,
                          fmt::format("{} is before the {} epoch ({})", to_iso8601(), epoch.name(),
                                      anchor.to_iso8601()));
    }

    TimeUnit unix_ts = timestamp_unix();
    const TimeEpoch unix_epoch = TimeEpoch::unix_time();
    switch (epoch.type()) {
        case TimeEpoch::Type::unix_time:
            return unix_ts;
        case TimeEpoch::Type::utc:
            return unix_ts - unix_epoch.distance_to(epoch) + table.until(*this).offset_tai();
        case TimeEpoch::Type::gps:
            return unix_ts - unix_epoch.distance_to(epoch) +
                   (table.until(*this).offset_tai() - table.until(anchor).offset_tai());
        case TimeEpoch::Type::tai:
            return (timestamp_unix() - anchor.timestamp_unix()) +
                   table.between(anchor, *this).offset_tai();
    }
    return unix_ts;
}

inline Result<TimeUnit> DateTime::timestamp(const TimeEpoch& epoch) const {
    auto table = LeapSeconds::load();
    if (!table) {
        return unexpected(table.error());
    }
    return timestamp(epoch, *table);
}

/// Same civil anchor, moved forward by TAI-UTC at this instant
inline DateTime DateTime::to_atomic_time(const LeapSeconds& table) const {
    return add(table.until(*this).offset_tai());
}

inline Result<DateTime> DateTime::to_atomic_time() const {
    auto table = LeapSeconds::load();
    if (!table) {
        return unexpected(table.error());
    }
    return to_atomic_time(*table);
}

/// Moved forward by the leap seconds inserted since the GPS epoch
inline DateTime DateTime::to_gps_time(const LeapSeconds& table) const {
    DateTime gps_anchor = TimeEpoch::gps().anchor();
    return add(table.until(*this).offset_tai() - table.until(gps_anchor).offset_tai());
}

inline Result<DateTime> DateTime::to_gps_time() const {
    auto table = LeapSeconds::load();
    if (!table) {
        return unexpected(table.error());
    }
    return to_gps_time(*table);
}

} // namespace tempora
