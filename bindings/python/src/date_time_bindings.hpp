#pragma once
// DateTime bindings: DateTime, LeapSecond, LeapSeconds, TimePeriod, TimePeriods

#include <nanobind/nanobind.h>
#include <nanobind/make_iterator.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <tempora.hpp>

#include "py_types.hpp"

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempora_python {

inline void bind_date_time(nb::module_& m) {
    using tempora::DateTime;
    using tempora::LeapSeconds;
    using tempora::TimeUnit;

    // =========================================================================
    // DateTime
    // =========================================================================

    nb::class_<DateTime>(m, "DateTime", "Point in time anchored to a zone or an offset")
        .def(nb::init<>(), "1970-01-01T00:00:00+00:00")
        .def_static(
            "create",
            [](int64_t year, int month, int day, int hour, int minute, int second,
               int microsecond, const std::string& zone) {
                return unwrap(
                    DateTime::create(year, month, day, hour, minute, second, microsecond, zone));
            },
            "year"_a, "month"_a, "day"_a, "hour"_a = 0, "minute"_a = 0, "second"_a = 0,
            "microsecond"_a = 0, "zone"_a = "UTC")
        .def_static(
            "from_string",
            [](const std::string& text) { return unwrap(DateTime::from_string(text)); }, "text"_a,
            "Parse an ISO-8601 date-time, optionally with a [Area/Location] suffix")
        .def_static("from_timestamp_unix",
                    nb::overload_cast<TimeUnit>(&DateTime::from_timestamp_unix), "timestamp"_a)
        .def_static("from_timestamp_unix",
                    nb::overload_cast<int64_t>(&DateTime::from_timestamp_unix), "seconds"_a)
        .def_prop_ro("year", &DateTime::year)
        .def_prop_ro("month", &DateTime::month)
        .def_prop_ro("day", &DateTime::day)
        .def_prop_ro("hour", &DateTime::hour)
        .def_prop_ro("minute", &DateTime::minute)
        .def_prop_ro("second", &DateTime::second)
        .def_prop_ro("microsecond", &DateTime::microsecond)
        .def_prop_ro("time_zone", &DateTime::time_zone, "Named zone, or None for offset-only values")
        .def_prop_ro("time_offset", &DateTime::time_offset)
        .def("is_daylight", &DateTime::is_daylight)
        .def("is_saving_time", &DateTime::is_saving_time)
        .def("day_of_week", [](const DateTime& dt) { return dt.date().day_of_week(); })
        .def("day_of_year", [](const DateTime& dt) { return dt.date().day_of_year(); })
        .def("to_iso8601", &DateTime::to_iso8601, "with_microseconds"_a = false)
        .def("modify", &DateTime::modify, "unit"_a, "count"_a)
        .def("add", &DateTime::add, "unit"_a)
        .def("sub", &DateTime::sub, "unit"_a)
        .def("add_hours", &DateTime::add_hours, "n"_a = 1)
        .def("sub_hours", &DateTime::sub_hours, "n"_a = 1)
        .def("add_minutes", &DateTime::add_minutes, "n"_a = 1)
        .def("sub_minutes", &DateTime::sub_minutes, "n"_a = 1)
        .def("add_seconds", &DateTime::add_seconds, "n"_a = 1)
        .def("sub_seconds", &DateTime::sub_seconds, "n"_a = 1)
        .def("add_days", &DateTime::add_days, "n"_a = 1)
        .def("sub_days", &DateTime::sub_days, "n"_a = 1)
        .def("add_weeks", &DateTime::add_weeks, "n"_a = 1)
        .def("sub_weeks", &DateTime::sub_weeks, "n"_a = 1)
        .def("add_months", &DateTime::add_months, "n"_a = 1)
        .def("sub_months", &DateTime::sub_months, "n"_a = 1)
        .def("add_years", &DateTime::add_years, "n"_a = 1)
        .def("sub_years", &DateTime::sub_years, "n"_a = 1)
        .def("midnight", &DateTime::midnight)
        .def("noon", &DateTime::noon)
        .def("end_of_day", &DateTime::end_of_day)
        .def("to_time_zone", &DateTime::to_time_zone, "zone"_a)
        .def("to_time_offset", &DateTime::to_time_offset, "offset"_a)
        .def("is_equal", &DateTime::is_equal, "other"_a)
        .def("is_before", &DateTime::is_before, "other"_a)
        .def("is_before_or_equal", &DateTime::is_before_or_equal, "other"_a)
        .def("is_after", &DateTime::is_after, "other"_a)
        .def("is_after_or_equal", &DateTime::is_after_or_equal, "other"_a)
        .def("timestamp_unix", &DateTime::timestamp_unix)
        .def(
            "timestamp",
            [](const DateTime& dt, const tempora::TimeEpoch& epoch) {
                return unwrap(dt.timestamp(epoch));
            },
            "epoch"_a, "Time elapsed since the epoch, counted on the epoch's own scale")
        .def("to_atomic_time", [](const DateTime& dt) { return unwrap(dt.to_atomic_time()); })
        .def("to_gps_time", [](const DateTime& dt) { return unwrap(dt.to_gps_time()); })
        .def("until", &DateTime::until, "point"_a)
        .def("since", &DateTime::since, "point"_a)
        .def("distance_until", &DateTime::distance_until, "point"_a)
        .def("distance_since", &DateTime::distance_since, "point"_a)
        .def(
            "iterate",
            [](const DateTime& dt, const DateTime& point, TimeUnit by) {
                return unwrap(dt.iterate(point, by));
            },
            "point"_a, "by"_a)
        .def("__eq__", &DateTime::is_equal)
        .def("__lt__", &DateTime::is_before)
        .def("__le__", &DateTime::is_before_or_equal)
        .def("__gt__", &DateTime::is_after)
        .def("__ge__", &DateTime::is_after_or_equal)
        .def("__str__", &DateTime::to_string)
        .def("__repr__",
             [](const DateTime& dt) { return "DateTime('" + dt.to_iso8601(true) + "')"; });

    // =========================================================================
    // LeapSeconds
    // =========================================================================

    nb::class_<tempora::LeapSecond>(m, "LeapSecond", "One change of the TAI-UTC difference")
        .def_ro("unix_seconds", &tempora::LeapSecond::unix_seconds)
        .def_ro("delta", &tempora::LeapSecond::delta)
        .def("date", &tempora::LeapSecond::date)
        .def("offset", &tempora::LeapSecond::offset)
        .def("is_leap_second", &tempora::LeapSecond::is_leap_second)
        .def("__repr__", [](const tempora::LeapSecond& r) {
            return "LeapSecond(" + r.date().to_iso8601() + ", " + std::to_string(r.delta) + ")";
        });

    nb::class_<LeapSeconds>(m, "LeapSeconds", "Table of TAI-UTC changes, or a view of one")
        .def_static("load", [] { return unwrap(LeapSeconds::load()); },
                    "The built-in table, parsed once per process")
        .def_static(
            "from_list",
            [](const std::string& text) { return unwrap(LeapSeconds::from_list(text)); },
            "text"_a, "Parse a list in IERS leap-seconds.list format")
        .def("until", &LeapSeconds::until, "point"_a)
        .def("since", &LeapSeconds::since, "point"_a)
        .def("between", &LeapSeconds::between, "a"_a, "b"_a)
        .def("offset_tai", &LeapSeconds::offset_tai)
        .def("count", &LeapSeconds::count)
        .def("expires", &LeapSeconds::expires)
        .def("__len__", &LeapSeconds::size)
        .def("__getitem__",
             [](const LeapSeconds& t, size_t i) {
                 if (i >= t.size()) {
                     throw nb::index_error();
                 }
                 return t[i];
             })
        .def(
            "__iter__",
            [](const LeapSeconds& t) {
                return nb::make_iterator(nb::type<LeapSeconds>(), "LeapSecondIterator", t.begin(),
                                         t.end());
            },
            nb::keep_alive<0, 1>());

    // =========================================================================
    // TimePeriod / TimePeriods
    // =========================================================================

    nb::class_<tempora::TimePeriods>(m, "TimePeriods", "Instants a fixed step apart")
        .def_prop_ro("step", &tempora::TimePeriods::step)
        .def("front", &tempora::TimePeriods::front)
        .def("back", &tempora::TimePeriods::back)
        .def("to_list", &tempora::TimePeriods::to_vector)
        .def("__len__", &tempora::TimePeriods::size)
        .def("__getitem__",
             [](const tempora::TimePeriods& p, size_t i) {
                 if (i >= p.size()) {
                     throw nb::index_error();
                 }
                 return p[i];
             })
        .def(
            "__iter__",
            [](const tempora::TimePeriods& p) {
                return nb::make_iterator(nb::type<tempora::TimePeriods>(), "TimePeriodsIterator",
                                         p.begin(), p.end());
            },
            nb::keep_alive<0, 1>());

    nb::class_<tempora::TimePeriod>(m, "TimePeriod", "Interval between two instants")
        .def(nb::init<DateTime, DateTime>(), "start"_a, "end"_a)
        .def_prop_ro("start", &tempora::TimePeriod::start)
        .def_prop_ro("end", &tempora::TimePeriod::end)
        .def("distance", &tempora::TimePeriod::distance)
        .def("is_forward", &tempora::TimePeriod::is_forward)
        .def("is_backward", &tempora::TimePeriod::is_backward)
        .def("contains", &tempora::TimePeriod::contains, "point"_a)
        .def("overlaps", &tempora::TimePeriod::overlaps, "other"_a)
        .def("abuts", &tempora::TimePeriod::abuts, "other"_a)
        .def("leap_seconds",
             [](const tempora::TimePeriod& p) { return unwrap(p.leap_seconds()); })
        .def(
            "iterate",
            [](const tempora::TimePeriod& p, TimeUnit by) { return unwrap(p.iterate(by)); },
            "by"_a)
        .def(
            "iterate_backward",
            [](const tempora::TimePeriod& p, TimeUnit by) {
                return unwrap(p.iterate_backward(by));
            },
            "by"_a);
}

} // namespace tempora_python
