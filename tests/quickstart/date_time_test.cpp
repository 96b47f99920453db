// [TITLE]
// Dates, Zones and Calendar Arithmetic
// [/TITLE]
//
// This test demonstrates creating DateTime values, moving them through
// the calendar and across time zones, and walking an interval in steps.

#include <gtest/gtest.h>
#include <tempora.hpp>

#include <string>
#include <vector>

using namespace tempora;

// [TEXT]
// All examples assume `using namespace tempora;`. Fallible operations return
// `Result<T>`; check it before dereferencing.
// [/TEXT]

// [EXAMPLE]
// Creating a DateTime
// [/EXAMPLE]

// [DESCRIPTION]
// `DateTime::create` validates the calendar date, the time of day and the
// zone name. The zone defaults to UTC. Invalid input comes back as an
// `Error` instead of a normalized date.
// [/DESCRIPTION]

TEST(QuickstartSnippet, CreateDateTime) {
    // [SNIPPET]
    auto launch = DateTime::create(2020, 1, 1, 0, 0, 0);
    auto local = DateTime::create(2020, 6, 1, 12, 0, 0, 0, "Europe/Warsaw");
    auto invalid = DateTime::create(2021, 2, 29, 0, 0, 0); // no leap day in 2021

    if (!invalid) {
        // invalid.error().code == ErrorCode::invalid_argument
    }

    auto seconds = launch->timestamp_unix().in_seconds(); // 1577836800
    auto text = local->to_iso8601();                       // "2020-06-01T12:00:00+02:00"
    // [/SNIPPET]

    ASSERT_TRUE(launch.has_value());
    ASSERT_TRUE(local.has_value());
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::invalid_argument);
    EXPECT_EQ(seconds, 1'577'836'800);
    EXPECT_EQ(text, "2020-06-01T12:00:00+02:00");
}

// [EXAMPLE]
// Month Arithmetic
// [/EXAMPLE]

// [DESCRIPTION]
// Adding months keeps the time of day and clamps the day to the end of the
// target month, so January 31st plus one month is the last day of February.
// [/DESCRIPTION]

TEST(QuickstartSnippet, MonthArithmetic) {
    // [SNIPPET]
    auto jan31 = *DateTime::create(2020, 1, 31, 10, 0, 0);

    auto leap_feb = jan31.add_month();             // 2020-02-29T10:00:00+00:00
    auto plain_feb = jan31.add_year().add_month(); // 2021-02-28T10:00:00+00:00
    auto generic = jan31.modify(CalendarUnit::week, 2);
    // [/SNIPPET]

    EXPECT_EQ(leap_feb.to_iso8601(), "2020-02-29T10:00:00+00:00");
    EXPECT_EQ(plain_feb.to_iso8601(), "2021-02-28T10:00:00+00:00");
    EXPECT_EQ(generic.to_iso8601(), "2020-02-14T10:00:00+00:00");
}

// [EXAMPLE]
// Time Zones
// [/EXAMPLE]

// [DESCRIPTION]
// `to_time_zone` keeps the instant and changes the wall clock. Comparisons
// use the instant, so the same moment in two zones is equal.
// [/DESCRIPTION]

TEST(QuickstartSnippet, TimeZones) {
    // [SNIPPET]
    auto utc = *DateTime::create(2020, 6, 1, 10, 0, 0);
    auto new_york = *TimeZone::create("America/New_York");

    auto local = utc.to_time_zone(new_york); // 2020-06-01T06:00:00-04:00
    bool same = local.is_equal(utc);         // true
    bool dst = local.is_daylight();          // true
    // [/SNIPPET]

    EXPECT_EQ(local.to_iso8601(), "2020-06-01T06:00:00-04:00");
    EXPECT_TRUE(same);
    EXPECT_TRUE(dst);
}

// [EXAMPLE]
// Parsing ISO-8601
// [/EXAMPLE]

// [DESCRIPTION]
// A plain offset produces an offset-only DateTime. A bracketed zone name
// attaches the zone and is checked against the offset.
// [/DESCRIPTION]

TEST(QuickstartSnippet, ParseIso8601) {
    // [SNIPPET]
    auto offset_only = DateTime::from_string("2020-06-01T12:00:00+02:00");
    auto zoned = DateTime::from_string("2020-06-01T12:00:00+02:00[Europe/Warsaw]");
    auto conflict = DateTime::from_string("2020-06-01T12:00:00+01:00[Europe/Warsaw]");
    // [/SNIPPET]

    ASSERT_TRUE(offset_only.has_value());
    EXPECT_FALSE(offset_only->time_zone().has_value());
    ASSERT_TRUE(zoned.has_value());
    EXPECT_EQ(zoned->time_zone()->name(), "Europe/Warsaw");
    EXPECT_FALSE(conflict.has_value());
}

// [EXAMPLE]
// Iterating an Interval
// [/EXAMPLE]

// [DESCRIPTION]
// `iterate` returns an index-addressable sequence. It starts at the origin
// and never steps past the other endpoint.
// [/DESCRIPTION]

TEST(QuickstartSnippet, IterateInterval) {
    // [SNIPPET]
    auto start = *DateTime::create(2020, 1, 1, 0, 0, 0);
    auto end = *DateTime::create(2020, 1, 1, 0, 0, 10);

    auto steps = TimePeriod(start, end).iterate(TimeUnit::seconds(3));

    std::vector<int> seconds;
    for (const auto& dt : *steps) {
        seconds.push_back(dt.second()); // 0, 3, 6, 9
    }
    // [/SNIPPET]

    ASSERT_TRUE(steps.has_value());
    EXPECT_EQ(seconds, (std::vector<int>{0, 3, 6, 9}));
}
