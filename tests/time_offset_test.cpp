#include <gtest/gtest.h>
#include <tempora.hpp>

using namespace tempora;

// ==============================================================================
// Construction
// ==============================================================================

TEST(TimeOffsetTest, DefaultIsUtc) {
    TimeOffset o;
    EXPECT_TRUE(o.is_utc());
    EXPECT_EQ(o, TimeOffset::utc());
    EXPECT_EQ(o.to_string(), "+00:00");
}

TEST(TimeOffsetTest, FromSeconds) {
    auto o = TimeOffset::from_seconds(5 * 3600 + 30 * 60);
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->total_seconds(), 19'800);
    EXPECT_FALSE(o->is_utc());
    EXPECT_EQ(o->to_string(), "+05:30");
    EXPECT_EQ(o->to_time_unit(), TimeUnit::seconds(19'800));
}

TEST(TimeOffsetTest, FromSecondsRejectsOutOfRange) {
    auto o = TimeOffset::from_seconds(19 * 3600);
    ASSERT_FALSE(o.has_value());
    EXPECT_EQ(o.error().code, ErrorCode::invalid_argument);

    EXPECT_TRUE(TimeOffset::from_seconds(-TimeOffset::MAX_SECONDS).has_value());
}

TEST(TimeOffsetTest, FromTimeUnit) {
    auto o = TimeOffset::from_time_unit(TimeUnit::hours(-3));
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->to_string(), "-03:00");

    auto fractional = TimeOffset::from_time_unit(TimeUnit::milliseconds(1'500));
    ASSERT_FALSE(fractional.has_value());
    EXPECT_EQ(fractional.error().code, ErrorCode::invalid_argument);
}

// ==============================================================================
// Parsing
// ==============================================================================

TEST(TimeOffsetTest, ParseAcceptedForms) {
    EXPECT_EQ(TimeOffset::from_string("Z")->total_seconds(), 0);
    EXPECT_EQ(TimeOffset::from_string("+02:00")->total_seconds(), 7'200);
    EXPECT_EQ(TimeOffset::from_string("-0930")->total_seconds(), -34'200);
    EXPECT_EQ(TimeOffset::from_string("+14")->total_seconds(), 50'400);
}

TEST(TimeOffsetTest, ParseRejectsMalformed) {
    for (const char* text :
         {"", "02:00", "+2:00", "+02:0", "+02:60", "+0200x", "UTC", "+19:00", "+01:00:60"}) {
        auto o = TimeOffset::from_string(text);
        EXPECT_FALSE(o.has_value()) << text;
    }
}

// ==============================================================================
// Rendering
// ==============================================================================

TEST(TimeOffsetTest, RenderingWithSeconds) {
    // Amsterdam local mean time before 1937
    auto o = TimeOffset::from_seconds(19 * 60 + 32);
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->to_string(), "+00:19:32");

    auto parsed = TimeOffset::from_string(o->to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, *o);
}

TEST(TimeOffsetTest, NegativeRendering) {
    auto o = TimeOffset::from_seconds(-(3 * 3600 + 30 * 60));
    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->to_string(), "-03:30");
}

TEST(TimeOffsetTest, Ordering) {
    EXPECT_LT(*TimeOffset::from_string("-01:00"), TimeOffset::utc());
    EXPECT_EQ(*TimeOffset::from_string("+0100"), *TimeOffset::from_string("+01:00"));
}
