#include <gtest/gtest.h>
#include <tempora.hpp>

#include <cstdint>

using namespace tempora;

// ==============================================================================
// Date validation
// ==============================================================================

TEST(DateTest, DefaultIsUnixEpochDay) {
    Date d;
    EXPECT_EQ(d.year(), 1970);
    EXPECT_EQ(d.month(), 1);
    EXPECT_EQ(d.day(), 1);
}

TEST(DateTest, CreateValid) {
    auto d = Date::create(2020, 2, 29);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year(), 2020);
    EXPECT_EQ(d->month(), 2);
    EXPECT_EQ(d->day(), 29);
    EXPECT_TRUE(d->is_leap_year());
    EXPECT_EQ(d->days_in_month(), 29);
}

TEST(DateTest, CreateRejectsNonexistentDays) {
    EXPECT_FALSE(Date::create(2021, 2, 29).has_value());
    EXPECT_FALSE(Date::create(2020, 4, 31).has_value());
    EXPECT_FALSE(Date::create(2020, 13, 1).has_value());
    EXPECT_FALSE(Date::create(2020, 0, 1).has_value());
    EXPECT_FALSE(Date::create(2020, 1, 0).has_value());

    auto d = Date::create(1900, 2, 29);
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(d.error().code, ErrorCode::invalid_argument);
}

TEST(DateTest, CreateRejectsYearOutOfRange) {
    EXPECT_FALSE(Date::create(Date::MAX_YEAR + 1, 1, 1).has_value());
    EXPECT_TRUE(Date::create(Date::MIN_YEAR, 1, 1).has_value());
}

TEST(DateTest, LeapYearRules) {
    EXPECT_TRUE(Date::create(2000, 1, 1)->is_leap_year());
    EXPECT_FALSE(Date::create(1900, 1, 1)->is_leap_year());
    EXPECT_TRUE(Date::create(2024, 1, 1)->is_leap_year());
    EXPECT_FALSE(Date::create(2023, 1, 1)->is_leap_year());
    // Proleptic: year 0 is 1 BC and a leap year
    EXPECT_TRUE(Date::create(0, 1, 1)->is_leap_year());
}

TEST(DateTest, DayOfWeekAndYear) {
    auto d = Date::create(2020, 1, 1);
    EXPECT_EQ(d->day_of_week(), 3); // Wednesday
    EXPECT_EQ(d->day_of_year(), 1);

    auto last = Date::create(2020, 12, 31);
    EXPECT_EQ(last->day_of_year(), 366);
    EXPECT_EQ(last->day_of_week(), 4); // Thursday

    EXPECT_EQ(Date::create(1970, 1, 4)->day_of_week(), 7); // Sunday
}

// ==============================================================================
// Date arithmetic
// ==============================================================================

TEST(DateTest, AddDaysRollsOver) {
    auto d = Date::create(2019, 12, 31)->add_days(1);
    EXPECT_EQ(d, *Date::create(2020, 1, 1));

    auto back = Date::create(2020, 3, 1)->add_days(-1);
    EXPECT_EQ(back, *Date::create(2020, 2, 29));
}

TEST(DateTest, AddMonthsClampsToEndOfMonth) {
    EXPECT_EQ(Date::create(2020, 1, 31)->add_months(1), *Date::create(2020, 2, 29));
    EXPECT_EQ(Date::create(2021, 1, 31)->add_months(1), *Date::create(2021, 2, 28));
    EXPECT_EQ(Date::create(2020, 3, 31)->add_months(1), *Date::create(2020, 4, 30));
    EXPECT_EQ(Date::create(2020, 3, 31)->add_months(-1), *Date::create(2020, 2, 29));
    EXPECT_EQ(Date::create(2020, 2, 29)->add_months(12), *Date::create(2021, 2, 28));
}

TEST(DateTest, AddMonthsAcrossYears) {
    EXPECT_EQ(Date::create(2020, 11, 15)->add_months(3), *Date::create(2021, 2, 15));
    EXPECT_EQ(Date::create(2020, 1, 15)->add_months(-13), *Date::create(2018, 12, 15));
}

TEST(DateTest, ArithmeticSaturatesAtSupportedRange) {
    auto last = *Date::create(Date::MAX_YEAR, 12, 31);
    auto first = *Date::create(Date::MIN_YEAR, 1, 1);

    EXPECT_EQ(last.add_days(1), last);
    EXPECT_EQ(last.add_months(60), last);
    EXPECT_EQ(first.add_days(-1), first);
    EXPECT_EQ(first.add_months(-1), first);

    EXPECT_EQ(Date::create(2020, 6, 15)->add_months(-3'000'000),
              *Date::create(Date::MIN_YEAR, 1, 15));
    EXPECT_EQ(Date::create(2020, 6, 15)->add_days(INT64_MAX), last);
    EXPECT_EQ(Date::create(Date::MAX_YEAR, 12, 1)->add_months(1),
              *Date::create(Date::MAX_YEAR, 12, 1));
}

TEST(DateTest, Ordering) {
    EXPECT_LT(*Date::create(2020, 1, 1), *Date::create(2020, 1, 2));
    EXPECT_GT(*Date::create(2021, 1, 1), *Date::create(2020, 12, 31));
}

// ==============================================================================
// Time of day
// ==============================================================================

TEST(TimeTest, CreateValid) {
    auto t = Time::create(23, 59, 59, 999'999);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour(), 23);
    EXPECT_EQ(t->minute(), 59);
    EXPECT_EQ(t->second(), 59);
    EXPECT_EQ(t->microsecond(), 999'999);
    EXPECT_EQ(*t, Time::end_of_day());
}

TEST(TimeTest, CreateRejectsOutOfRange) {
    EXPECT_FALSE(Time::create(24, 0, 0).has_value());
    EXPECT_FALSE(Time::create(0, 60, 0).has_value());
    EXPECT_FALSE(Time::create(0, 0, 60).has_value());
    EXPECT_FALSE(Time::create(0, 0, 0, 1'000'000).has_value());
    EXPECT_FALSE(Time::create(-1, 0, 0).has_value());
}

TEST(TimeTest, NamedTimes) {
    EXPECT_EQ(Time::midnight(), Time());
    EXPECT_EQ(Time::noon().hour(), 12);
    EXPECT_LT(Time::noon(), Time::end_of_day());
}

// ==============================================================================
// CalendarUnit
// ==============================================================================

TEST(CalendarUnitTest, Classification) {
    EXPECT_TRUE(is_calendar_based(CalendarUnit::month));
    EXPECT_TRUE(is_calendar_based(CalendarUnit::week));
    EXPECT_FALSE(is_calendar_based(CalendarUnit::hour));
    EXPECT_STREQ(calendar_unit_string(CalendarUnit::year), "year");
}
