#pragma once
// Core bindings: TimeUnit, TimeOffset, CalendarUnit, TimeZone, TimeEpoch

#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>

#include <tempora/calendar.hpp>
#include <tempora/time_epoch.hpp>
#include <tempora/time_offset.hpp>
#include <tempora/time_unit.hpp>
#include <tempora/time_zone.hpp>

#include "py_types.hpp"

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_core(nb::module_& m) {
    using tempora::TimeUnit;

    // =========================================================================
    // TimeUnit
    // =========================================================================

    nb::class_<TimeUnit>(m, "TimeUnit", "Signed duration with microsecond precision")
        .def(nb::init<>())
        .def_static("zero", &TimeUnit::zero)
        .def_static("microseconds", &TimeUnit::microseconds, "us"_a)
        .def_static("milliseconds", &TimeUnit::milliseconds, "ms"_a)
        .def_static("seconds", &TimeUnit::seconds, "s"_a)
        .def_static("minutes", &TimeUnit::minutes, "m"_a)
        .def_static("hours", &TimeUnit::hours, "h"_a)
        .def_static("days", &TimeUnit::days, "d"_a)
        .def_static("positive", &TimeUnit::positive, "seconds"_a, "microsecond"_a = 0)
        .def_static("negative", &TimeUnit::negative, "seconds"_a, "microsecond"_a = 0)
        .def_static("precise", &TimeUnit::precise, "seconds"_a,
                    "Checked conversion from float seconds (None on overflow or NaN)")
        .def_prop_ro("in_seconds", &TimeUnit::in_seconds,
                     "Whole seconds, truncated toward zero and signed")
        .def_prop_ro("microsecond", &TimeUnit::microsecond,
                     "Microsecond fraction of the magnitude")
        .def_prop_ro("total_microseconds", &TimeUnit::total_microseconds)
        .def_prop_ro("in_milliseconds", &TimeUnit::in_milliseconds)
        .def_prop_ro("in_minutes", &TimeUnit::in_minutes)
        .def_prop_ro("in_hours", &TimeUnit::in_hours)
        .def_prop_ro("in_days", &TimeUnit::in_days)
        .def("to_seconds", &TimeUnit::to_seconds)
        .def("in_seconds_precise", &TimeUnit::in_seconds_precise)
        .def("is_zero", &TimeUnit::is_zero)
        .def("is_positive", &TimeUnit::is_positive)
        .def("is_negative", &TimeUnit::is_negative)
        .def("abs", &TimeUnit::abs)
        .def("invert", &TimeUnit::invert)
        .def(-nb::self)
        .def(nb::self + nb::self)
        .def(nb::self - nb::self)
        .def(nb::self * int64_t())
        .def(nb::self == nb::self)
        .def(nb::self != nb::self)
        .def(nb::self < nb::self)
        .def(nb::self <= nb::self)
        .def(nb::self > nb::self)
        .def(nb::self >= nb::self)
        .def("__repr__",
             [](const TimeUnit& u) { return "TimeUnit(" + u.in_seconds_precise() + ")"; });

    // =========================================================================
    // TimeOffset
    // =========================================================================

    nb::class_<tempora::TimeOffset>(m, "TimeOffset", "Fixed offset from UTC")
        .def_static("utc", &tempora::TimeOffset::utc)
        .def_static(
            "from_seconds",
            [](int64_t s) { return unwrap(tempora::TimeOffset::from_seconds(s)); }, "seconds"_a)
        .def_static(
            "from_string",
            [](const std::string& text) { return unwrap(tempora::TimeOffset::from_string(text)); },
            "text"_a, "Parse 'Z', '+HH:MM', '+HHMM' or '+HH'")
        .def_prop_ro("total_seconds", &tempora::TimeOffset::total_seconds)
        .def("to_time_unit", &tempora::TimeOffset::to_time_unit)
        .def("is_utc", &tempora::TimeOffset::is_utc)
        .def(nb::self == nb::self)
        .def("__str__", &tempora::TimeOffset::to_string)
        .def("__repr__", [](const tempora::TimeOffset& o) {
            return "TimeOffset('" + o.to_string() + "')";
        });

    // =========================================================================
    // CalendarUnit
    // =========================================================================

    nb::enum_<tempora::CalendarUnit>(m, "CalendarUnit", "Units accepted by DateTime.modify")
        .value("microsecond", tempora::CalendarUnit::microsecond)
        .value("second", tempora::CalendarUnit::second)
        .value("minute", tempora::CalendarUnit::minute)
        .value("hour", tempora::CalendarUnit::hour)
        .value("day", tempora::CalendarUnit::day)
        .value("week", tempora::CalendarUnit::week)
        .value("month", tempora::CalendarUnit::month)
        .value("year", tempora::CalendarUnit::year)
        .def("__str__", [](tempora::CalendarUnit u) {
            return std::string(tempora::calendar_unit_string(u));
        });

    // =========================================================================
    // TimeZone
    // =========================================================================

    nb::class_<tempora::TimeZone>(m, "TimeZone", "Named IANA time zone")
        .def_static(
            "create",
            [](const std::string& name) { return unwrap(tempora::TimeZone::create(name)); },
            "name"_a)
        .def_static("utc", &tempora::TimeZone::utc)
        .def_prop_ro("name", &tempora::TimeZone::name)
        .def(nb::self == nb::self)
        .def("__repr__", [](const tempora::TimeZone& z) { return "TimeZone('" + z.name() + "')"; });

    // =========================================================================
    // TimeEpoch
    // =========================================================================

    nb::class_<tempora::TimeEpoch>(m, "TimeEpoch", "UNIX / UTC / GPS / TAI reference epochs")
        .def_static("UNIX", &tempora::TimeEpoch::unix_time)
        .def_static("UTC", &tempora::TimeEpoch::utc)
        .def_static("GPS", &tempora::TimeEpoch::gps)
        .def_static("TAI", &tempora::TimeEpoch::tai)
        .def_prop_ro("name", [](const tempora::TimeEpoch& e) { return std::string(e.name()); })
        .def("anchor", &tempora::TimeEpoch::anchor)
        .def("distance_to", &tempora::TimeEpoch::distance_to, "other"_a,
             "Signed leap-second free distance between the two anchors")
        .def(nb::self == nb::self)
        .def("__repr__", [](const tempora::TimeEpoch& e) {
            return std::string("TimeEpoch.") + e.name();
        });
}

} // namespace tempora_python
