#include <gtest/gtest.h>
#include <tempora.hpp>

#include <vector>

using namespace tempora;

class TimeEpochTest : public ::testing::Test {
protected:
    static DateTime utc(int64_t y, int mo, int d, int h = 0, int mi = 0, int s = 0, int us = 0) {
        return *DateTime::create(y, mo, d, h, mi, s, us);
    }

    static TimeUnit timestamp(const DateTime& t, const TimeEpoch& e) {
        auto ts = t.timestamp(e);
        EXPECT_TRUE(ts.has_value()) << t.to_iso8601() << " / " << e.name();
        return ts.value_or(TimeUnit::zero());
    }

    static constexpr int64_t UNIX_2017 = 1'483'228'800;
    static constexpr int64_t UNIX_UTC_DISTANCE = 63'072'000;
    static constexpr int64_t UNIX_GPS_DISTANCE = 315'964'800;
    static constexpr int64_t TAI_UNIX_DISTANCE = 378'691'200;
};

// ==============================================================================
// Anchors
// ==============================================================================

TEST_F(TimeEpochTest, Names) {
    EXPECT_STREQ(TimeEpoch::unix_time().name(), "UNIX");
    EXPECT_STREQ(TimeEpoch::utc().name(), "UTC");
    EXPECT_STREQ(TimeEpoch::gps().name(), "GPS");
    EXPECT_STREQ(TimeEpoch::tai().name(), "TAI");
}

TEST_F(TimeEpochTest, Anchors) {
    EXPECT_EQ(TimeEpoch::unix_time().anchor().to_iso8601(), "1970-01-01T00:00:00+00:00");
    EXPECT_EQ(TimeEpoch::utc().anchor().to_iso8601(), "1972-01-01T00:00:00+00:00");
    EXPECT_EQ(TimeEpoch::gps().anchor().to_iso8601(), "1980-01-06T00:00:00+00:00");
    EXPECT_EQ(TimeEpoch::tai().anchor().to_iso8601(), "1958-01-01T00:00:00+00:00");
}

TEST_F(TimeEpochTest, DistanceIsSigned) {
    EXPECT_EQ(TimeEpoch::unix_time().distance_to(TimeEpoch::gps()),
              TimeUnit::seconds(UNIX_GPS_DISTANCE));
    EXPECT_EQ(TimeEpoch::gps().distance_to(TimeEpoch::unix_time()),
              TimeUnit::seconds(-UNIX_GPS_DISTANCE));
    EXPECT_EQ(TimeEpoch::tai().distance_to(TimeEpoch::unix_time()),
              TimeUnit::seconds(TAI_UNIX_DISTANCE));
    EXPECT_TRUE(TimeEpoch::utc().distance_to(TimeEpoch::utc()).is_zero());
}

TEST_F(TimeEpochTest, DistanceMatchesAnchors) {
    std::vector<TimeEpoch> epochs = {TimeEpoch::unix_time(), TimeEpoch::utc(), TimeEpoch::gps(),
                                     TimeEpoch::tai()};
    for (const auto& a : epochs) {
        for (const auto& b : epochs) {
            EXPECT_EQ(a.distance_to(b), a.anchor().distance_until(b.anchor()) *
                                            (a.anchor().is_before(b.anchor()) ? 1 : -1))
                << a.name() << " -> " << b.name();
        }
    }
}

// ==============================================================================
// Conversions
// ==============================================================================

TEST_F(TimeEpochTest, UnixAtEpochIsZero) {
    auto t = *DateTime::create(1970, 1, 1, 0, 0, 0, 0, "UTC");
    EXPECT_TRUE(timestamp(t, TimeEpoch::unix_time()).is_zero());
}

TEST_F(TimeEpochTest, UnixMatchesTimestampUnix) {
    auto t = utc(2020, 1, 1, 0, 0, 0, 250'000);
    EXPECT_EQ(timestamp(t, TimeEpoch::unix_time()), t.timestamp_unix());
}

TEST_F(TimeEpochTest, UtcAndTaiCarryCumulativeLeapSeconds) {
    auto t = utc(2017, 1, 1);
    auto unix_ts = t.timestamp_unix();
    auto utc_ts = timestamp(t, TimeEpoch::utc());
    auto tai_ts = timestamp(t, TimeEpoch::tai());

    EXPECT_EQ(unix_ts.in_seconds(), UNIX_2017);
    EXPECT_EQ(utc_ts - (unix_ts - TimeUnit::seconds(UNIX_UTC_DISTANCE)), TimeUnit::seconds(37));
    EXPECT_EQ(tai_ts - TimeEpoch::tai().anchor().distance_until(t), TimeUnit::seconds(37));
    EXPECT_EQ(utc_ts.in_seconds(), 1'420'156'837);
    EXPECT_EQ(tai_ts.in_seconds(), 1'861'920'037);
}

TEST_F(TimeEpochTest, GpsCountsLeapSecondsAfterItsEpoch) {
    auto t = utc(2017, 1, 1);
    EXPECT_EQ(timestamp(t, TimeEpoch::gps()).in_seconds(), 1'167'264'018);
    EXPECT_TRUE(timestamp(TimeEpoch::gps().anchor(), TimeEpoch::gps()).is_zero());
}

TEST_F(TimeEpochTest, GpsAndTaiDifferByNineteenSeconds) {
    // Constant offset between two continuous scales, whatever the date
    for (const auto& t : {utc(1985, 7, 1), utc(2000, 1, 1), utc(2017, 1, 1), utc(2024, 5, 5)}) {
        auto gps = timestamp(t, TimeEpoch::gps());
        auto tai = timestamp(t, TimeEpoch::tai());
        EXPECT_EQ(tai - gps - TimeEpoch::tai().distance_to(TimeEpoch::gps()),
                  TimeUnit::seconds(19))
            << t.to_iso8601();
    }
}

TEST_F(TimeEpochTest, FractionPreserved) {
    auto t = utc(2017, 1, 1, 0, 0, 0, 250'000);
    auto ts = timestamp(t, TimeEpoch::utc());
    EXPECT_EQ(ts.in_seconds(), 1'420'156'837);
    EXPECT_EQ(ts.microsecond(), 250'000);
}

TEST_F(TimeEpochTest, TaiBeforeFirstLeapRecord) {
    auto t = utc(1970, 1, 1);
    EXPECT_EQ(timestamp(t, TimeEpoch::tai()).in_seconds(), TAI_UNIX_DISTANCE);
}

TEST_F(TimeEpochTest, ZonedInstantConvertsLikeUtc) {
    auto warsaw = *DateTime::create(2017, 1, 1, 1, 0, 0, 0, "Europe/Warsaw");
    auto t = utc(2017, 1, 1);
    for (const auto& e : {TimeEpoch::unix_time(), TimeEpoch::utc(), TimeEpoch::gps(),
                          TimeEpoch::tai()}) {
        EXPECT_EQ(timestamp(warsaw, e), timestamp(t, e)) << e.name();
    }
}

// ==============================================================================
// Domain errors
// ==============================================================================

TEST_F(TimeEpochTest, BeforeEpochIsDomainError) {
    struct Case {
        DateTime point;
        TimeEpoch epoch;
    };
    std::vector<Case> cases = {
        {utc(1969, 12, 31, 23, 59, 59), TimeEpoch::unix_time()},
        {utc(1971, 12, 31), TimeEpoch::utc()},
        {utc(1980, 1, 5, 23, 59, 59, 999'999), TimeEpoch::gps()},
        {utc(1957, 12, 31), TimeEpoch::tai()},
    };
    for (const auto& c : cases) {
        auto ts = c.point.timestamp(c.epoch);
        ASSERT_FALSE(ts.has_value()) << c.epoch.name();
        EXPECT_EQ(ts.error().code, ErrorCode::domain_error);
    }
}

TEST_F(TimeEpochTest, AnchorItselfIsInDomain) {
    for (const auto& e : {TimeEpoch::unix_time(), TimeEpoch::utc(), TimeEpoch::gps(),
                          TimeEpoch::tai()}) {
        EXPECT_TRUE(e.anchor().timestamp(e).has_value()) << e.name();
    }
}

// ==============================================================================
// Monotonicity
// ==============================================================================

TEST_F(TimeEpochTest, TimestampsAreMonotonic) {
    std::vector<DateTime> points = {
        utc(1980, 1, 6),
        utc(1980, 1, 6, 0, 0, 0, 1),
        utc(1981, 6, 30, 23, 59, 59),
        utc(1981, 7, 1),
        utc(1999, 12, 31, 23, 59, 59, 999'999),
        utc(2016, 12, 31, 23, 59, 59),
        utc(2017, 1, 1),
        utc(2017, 1, 1, 0, 0, 1),
        utc(2040, 1, 1),
    };
    for (const auto& e : {TimeEpoch::unix_time(), TimeEpoch::utc(), TimeEpoch::gps(),
                          TimeEpoch::tai()}) {
        for (std::size_t i = 1; i < points.size(); ++i) {
            ASSERT_TRUE(points[i - 1].is_before(points[i]));
            EXPECT_LT(timestamp(points[i - 1], e), timestamp(points[i], e))
                << e.name() << " at " << points[i].to_iso8601();
        }
    }
}

// ==============================================================================
// Atomic and GPS time
// ==============================================================================

TEST_F(TimeEpochTest, AtomicTime) {
    auto atomic = utc(2017, 1, 1).to_atomic_time();
    ASSERT_TRUE(atomic.has_value());
    EXPECT_EQ(atomic->to_iso8601(), "2017-01-01T00:00:37+00:00");
    EXPECT_EQ(utc(2017, 1, 1).distance_until(*atomic), TimeUnit::seconds(37));

    auto before = utc(2016, 12, 31, 23, 59, 59).to_atomic_time();
    EXPECT_EQ(before->to_iso8601(), "2017-01-01T00:00:35+00:00");
}

TEST_F(TimeEpochTest, GpsTime) {
    auto gps = utc(2017, 1, 1).to_gps_time();
    ASSERT_TRUE(gps.has_value());
    EXPECT_EQ(gps->to_iso8601(), "2017-01-01T00:00:18+00:00");

    auto at_epoch = TimeEpoch::gps().anchor().to_gps_time();
    EXPECT_TRUE(at_epoch->is_equal(TimeEpoch::gps().anchor()));
}

TEST_F(TimeEpochTest, AtomicTimeKeepsAnchor) {
    auto warsaw = *DateTime::create(2017, 6, 1, 12, 0, 0, 0, "Europe/Warsaw");
    auto atomic = warsaw.to_atomic_time();
    ASSERT_TRUE(atomic.has_value());
    EXPECT_EQ(atomic->to_iso8601(), "2017-06-01T12:00:37+02:00");
    EXPECT_EQ(atomic->time_zone()->name(), "Europe/Warsaw");
}
