#include <gtest/gtest.h>
#include <tempora/detail/iso8601.hpp>

using namespace tempora;
using detail::Iso8601Parser;

TEST(Iso8601ParserTest, DateOnly) {
    auto f = Iso8601Parser("2020-02-29").parse();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->year, 2020);
    EXPECT_EQ(f->month, 2);
    EXPECT_EQ(f->day, 29);
    EXPECT_EQ(f->hour, 0);
    EXPECT_FALSE(f->offset.has_value());
    EXPECT_FALSE(f->zone.has_value());
}

TEST(Iso8601ParserTest, DateTimeWithFraction) {
    auto f = Iso8601Parser("2020-01-01T10:20:30.25").parse();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->hour, 10);
    EXPECT_EQ(f->minute, 20);
    EXPECT_EQ(f->second, 30);
    EXPECT_EQ(f->microsecond, 250'000);
}

TEST(Iso8601ParserTest, SpaceSeparatorAndNoSeconds) {
    auto f = Iso8601Parser("2020-01-01 10:20").parse();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->hour, 10);
    EXPECT_EQ(f->minute, 20);
    EXPECT_EQ(f->second, 0);
}

TEST(Iso8601ParserTest, OffsetAndZone) {
    auto f = Iso8601Parser("2020-06-01T12:00:00+02:00[Europe/Warsaw]").parse();
    ASSERT_TRUE(f.has_value());
    ASSERT_TRUE(f->offset.has_value());
    EXPECT_EQ(f->offset->total_seconds(), 7'200);
    ASSERT_TRUE(f->zone.has_value());
    EXPECT_EQ(*f->zone, "Europe/Warsaw");
}

TEST(Iso8601ParserTest, ZuluSuffix) {
    auto f = Iso8601Parser("2020-06-01T12:00:00Z").parse();
    ASSERT_TRUE(f.has_value());
    ASSERT_TRUE(f->offset.has_value());
    EXPECT_TRUE(f->offset->is_utc());
}

TEST(Iso8601ParserTest, NegativeAndLongYears) {
    auto f = Iso8601Parser("-0044-03-15").parse();
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->year, -44);

    auto far = Iso8601Parser("12345-01-01").parse();
    ASSERT_TRUE(far.has_value());
    EXPECT_EQ(far->year, 12'345);
}

TEST(Iso8601ParserTest, RejectsMalformed) {
    for (const char* text : {"", "2020", "2020-1-01", "2020-01-01T", "2020-01-01T10",
                             "2020-01-01T10:20:30.", "2020-01-01T10:20:30.1234567",
                             "2020-01-01T10:20:30+25:00", "2020-01-01T10:20:30[Europe/Warsaw",
                             "2020-01-01T10:20:30Zjunk"}) {
        auto f = Iso8601Parser(text).parse();
        ASSERT_FALSE(f.has_value()) << text;
        EXPECT_EQ(f.error().code, ErrorCode::invalid_argument) << text;
    }
}
