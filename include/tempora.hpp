#pragma once

/**
 * @file tempora.hpp
 * @brief Umbrella header for the tempora date-time library
 *
 * Types provided:
 * - TimeUnit - signed duration with microsecond precision
 * - TimeOffset - fixed UTC offset
 * - Date, Time, CalendarUnit - civil calendar leaf values
 * - TimeZone - named IANA zone
 * - DateTime - point in time anchored to a zone or an offset
 * - LeapSeconds, LeapSecond - TAI-UTC change table
 * - TimeEpoch - UNIX / UTC / GPS / TAI reference epochs
 * - TimePeriod, TimePeriods - intervals and stepped sequences
 *
 * DateTime's epoch and interval operations are defined in time_epoch.hpp and
 * time_period.hpp; include this header (or both of those) to use them.
 */

#include "tempora/calendar.hpp"
#include "tempora/date_time.hpp"
#include "tempora/error.hpp"
#include "tempora/expected.hpp"
#include "tempora/leap_seconds.hpp"
#include "tempora/time_epoch.hpp"
#include "tempora/time_offset.hpp"
#include "tempora/time_period.hpp"
#include "tempora/time_unit.hpp"
#include "tempora/time_zone.hpp"
