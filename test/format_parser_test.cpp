#include "typeguesser/format_parser.h"

#include <gtest/gtest.h>

using namespace typeguesser;

class FormatParserTest : public ::testing::Test {
protected:
  CultureConfig culture = CultureConfig::invariant();
  FormatParser parser{culture};
  ParsedDateTime out;
};

TEST_F(FormatParserTest, NumericDate) {
  ASSERT_TRUE(parser.parse("2024-01-15", "%Y-%m-%d", out));
  EXPECT_EQ(out.year, 2024);
  EXPECT_EQ(out.month, 1);
  EXPECT_EQ(out.day, 15);
}

TEST_F(FormatParserTest, SingleDigitMonthAndDay) {
  ASSERT_TRUE(parser.parse("3/7/2024", "%m/%d/%Y", out));
  EXPECT_EQ(out.month, 3);
  EXPECT_EQ(out.day, 7);
}

TEST_F(FormatParserTest, TwoDigitYearPivot) {
  ASSERT_TRUE(parser.parse("01/02/24", "%m/%d/%y", out));
  EXPECT_EQ(out.year, 2024);
  ASSERT_TRUE(parser.parse("01/02/75", "%m/%d/%y", out));
  EXPECT_EQ(out.year, 1975);
}

TEST_F(FormatParserTest, MonthNames) {
  ASSERT_TRUE(parser.parse("15 Jan 2024", "%d %b %Y", out));
  EXPECT_EQ(out.month, 1);
  ASSERT_TRUE(parser.parse("15-september-2024", "%d-%B-%Y", out));
  EXPECT_EQ(out.month, 9);
  EXPECT_FALSE(parser.parse("15 Foo 2024", "%d %b %Y", out));
}

TEST_F(FormatParserTest, CompactDate) {
  ASSERT_TRUE(parser.parse("20240115", "%Y%m%d", out));
  EXPECT_EQ(out.year, 2024);
  EXPECT_EQ(out.month, 1);
  EXPECT_EQ(out.day, 15);
}

TEST_F(FormatParserTest, InvalidCalendarDay) {
  EXPECT_FALSE(parser.parse("2023-02-29", "%Y-%m-%d", out));
  EXPECT_TRUE(parser.parse("2024-02-29", "%Y-%m-%d", out));
  EXPECT_FALSE(parser.parse("2024-13-01", "%Y-%m-%d", out));
}

TEST_F(FormatParserTest, TwelveHourClock) {
  ASSERT_TRUE(parser.parse("1/2/2024 3:45 PM", "%m/%d/%Y %I:%M %p", out));
  EXPECT_EQ(out.effective_hour(), 15);
  ASSERT_TRUE(parser.parse("1/2/2024 12:00 am", "%m/%d/%Y %I:%M %p", out));
  EXPECT_EQ(out.effective_hour(), 0);
}

TEST_F(FormatParserTest, TimeOnlyFormat) {
  ASSERT_TRUE(parser.parse("23:59:58", "%H:%M:%S", out));
  EXPECT_EQ(out.hour, 23);
  EXPECT_EQ(out.second, 58);
  EXPECT_FALSE(parser.parse("24:00", "%H:%M", out));
}

TEST_F(FormatParserTest, FractionalSeconds) {
  ASSERT_TRUE(parser.parse("10:20:30.25", "%H:%M:%S", out));
  EXPECT_EQ(out.microsecond, 250000);
}

TEST_F(FormatParserTest, ShorthandSpecifiers) {
  ASSERT_TRUE(parser.parse("2024-06-01 08:30:00", "%F %T", out));
  EXPECT_EQ(out.month, 6);
  EXPECT_EQ(out.hour, 8);
  EXPECT_EQ(out.minute, 30);
}

TEST_F(FormatParserTest, MustConsumeWholeInput) {
  EXPECT_FALSE(parser.parse("2024-01-15x", "%Y-%m-%d", out));
  EXPECT_FALSE(parser.parse("2024-01", "%Y-%m-%d", out));
  EXPECT_FALSE(parser.parse("2024-01-15", "%Y-%m-%d %Q", out));
}

TEST_F(FormatParserTest, Iso8601) {
  ASSERT_TRUE(parser.parse_iso8601("2024-01-15", out));
  EXPECT_EQ(out.to_days_since_epoch(), 19737);

  ASSERT_TRUE(parser.parse_iso8601("2024-01-15T10:30:00Z", out));
  EXPECT_EQ(out.hour, 10);
  EXPECT_EQ(out.minute, 30);

  ASSERT_TRUE(parser.parse_iso8601("2024-01-15 10:30", out));
  EXPECT_FALSE(parser.parse_iso8601("2024-01-15X10:30", out));
  EXPECT_FALSE(parser.parse_iso8601("15/01/2024", out));
}

TEST_F(FormatParserTest, Iso8601Offset) {
  ASSERT_TRUE(parser.parse_iso8601("1970-01-01T02:00:00+02:00", out));
  EXPECT_EQ(out.to_micros_since_epoch(), 0);
}

TEST_F(FormatParserTest, EpochArithmetic) {
  ASSERT_TRUE(parser.parse_iso8601("1970-01-02", out));
  EXPECT_EQ(out.to_micros_since_epoch(), 86400LL * 1000000LL);
  ASSERT_TRUE(parser.parse_iso8601("1969-12-31", out));
  EXPECT_EQ(out.to_days_since_epoch(), -1);
}

TEST_F(FormatParserTest, OffsetDirective) {
  ASSERT_TRUE(parser.parse("2024-01-15 10:00 -0130", "%Y-%m-%d %H:%M %z", out));
  EXPECT_EQ(out.utc_offset_minutes, -90);
  EXPECT_FALSE(parser.parse("2024-01-15 10:00 +021", "%Y-%m-%d %H:%M %z", out));
  EXPECT_FALSE(parser.parse("2024-01-15 10:00 +15:00", "%Y-%m-%d %H:%M %z", out));
}

TEST_F(FormatParserTest, WeekdayNameIsSkipped) {
  ASSERT_TRUE(parser.parse("Mon 15 Jan 2024", "%a %d %b %Y", out));
  EXPECT_EQ(out.day, 15);
  EXPECT_FALSE(parser.parse("Xyz 15 Jan 2024", "%a %d %b %Y", out));
}

TEST_F(FormatParserTest, LiteralPercent) {
  ASSERT_TRUE(parser.parse("2024%01", "%Y%%%m", out));
  EXPECT_EQ(out.month, 1);
  EXPECT_FALSE(parser.parse("2024-01-15", "%Y-%m-%", out));
}
