#pragma once

#include "tempora/error.hpp"
#include "tempora/time_offset.hpp"

#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace tempora {

/**
 * @brief Named IANA time zone
 *
 * Wraps an absl::TimeZone loaded from the system zoneinfo database. The only
 * service the rest of the library needs from a zone is offset resolution:
 * "what is this zone's UTC offset at that instant".
 *
 * Copies are cheap (absl::TimeZone is a handle into a process-wide cache).
 */
class TimeZone {
public:
    /**
     * @brief Resolve a zone by IANA name ("Europe/Warsaw", "UTC", ...)
     * @return The zone, or ErrorCode::unknown_zone if the database has no such name
     */
    static Result<TimeZone> create(std::string_view name) {
        absl::TimeZone zone;
        if (name.empty() || !absl::LoadTimeZone(std::string(name), &zone)) {
            return make_error(ErrorCode::unknown_zone,
                              fmt::format("\"{}\" is not a known time zone", name));
        }
        return TimeZone(std::string(name), zone);
    }

    static TimeZone utc() { return TimeZone("UTC", absl::UTCTimeZone()); }

    const std::string& name() const noexcept { return name_; }

    /// Offset in effect at an absolute instant
    TimeOffset offset_at(absl::Time instant) const {
        // Zone data never exceeds TimeOffset::MAX_SECONDS, so the check cannot fail
        return TimeOffset::from_seconds(zone_.At(instant).offset).value_or(TimeOffset::utc());
    }

    /**
     * Offset in effect at a wall-clock time
     *
     * Repeated wall times resolve to the earlier instant; skipped wall times
     * resolve with the offset in effect before the transition.
     */
    TimeOffset offset_at(absl::CivilSecond civil) const { return offset_at(resolve(civil)); }

    /// Absolute instant of a wall-clock time (same gap/overlap rule as offset_at)
    absl::Time resolve(absl::CivilSecond civil) const { return zone_.At(civil).pre; }

    /// Wall-clock time at an absolute instant
    absl::CivilSecond civil_at(absl::Time instant) const { return zone_.At(instant).cs; }

    bool is_dst_at(absl::Time instant) const { return zone_.At(instant).is_dst; }

    std::string abbreviation_at(absl::Time instant) const { return zone_.At(instant).zone_abbr; }

    const absl::TimeZone& native() const noexcept { return zone_; }

    friend bool operator==(const TimeZone& a, const TimeZone& b) noexcept {
        return a.name_ == b.name_;
    }

private:
    std::string name_;
    absl::TimeZone zone_;

    TimeZone(std::string name, absl::TimeZone zone) : name_(std::move(name)), zone_(zone) {}
};

} // namespace tempora
