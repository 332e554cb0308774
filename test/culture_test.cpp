#include "typeguesser/culture.h"
#include "typeguesser/settings.h"
#include "typeguesser/utf8.h"

#include <gtest/gtest.h>
#include <string>

using namespace typeguesser;

TEST(CultureTest, InvariantDefaults) {
  CultureConfig culture = CultureConfig::invariant();
  EXPECT_EQ(culture.decimal_mark, '.');
  EXPECT_EQ(culture.thousands_sep, ',');
  EXPECT_EQ(culture.date_order, DateFormatPreference::MONTH_FIRST);
  EXPECT_EQ(culture.month_abbr.size(), 12u);
  EXPECT_EQ(culture.month_full.size(), 12u);
  EXPECT_EQ(culture.am_pm.size(), 2u);
}

TEST(CultureTest, EuropeanPreset) {
  CultureConfig culture = CultureConfig::european();
  EXPECT_EQ(culture.decimal_mark, ',');
  EXPECT_EQ(culture.thousands_sep, '.');
  EXPECT_EQ(culture.date_order, DateFormatPreference::DAY_FIRST);
  EXPECT_STREQ(date_format_preference_name(culture.date_order), "DAY_FIRST");
}

TEST(CultureTest, BooleanLiterals) {
  CultureConfig culture = CultureConfig::invariant();
  EXPECT_EQ(culture.match_boolean("true", false), 1);
  EXPECT_EQ(culture.match_boolean("FALSE", false), 0);
  EXPECT_EQ(culture.match_boolean("  Yes ", false), 1);
  EXPECT_EQ(culture.match_boolean("nein", false), 0);
  EXPECT_EQ(culture.match_boolean(".T.", false), 1);
  EXPECT_EQ(culture.match_boolean("maybe", false), -1);
  EXPECT_EQ(culture.match_boolean("", false), -1);
}

TEST(CultureTest, DigitsAreNeverBooleans) {
  CultureConfig culture = CultureConfig::invariant();
  EXPECT_EQ(culture.match_boolean("1", true), -1);
  EXPECT_EQ(culture.match_boolean("0", true), -1);
}

TEST(CultureTest, SingleCharacterLiteralsNeedOptIn) {
  CultureConfig culture = CultureConfig::invariant();
  EXPECT_EQ(culture.match_boolean("Y", false), -1);
  EXPECT_EQ(culture.match_boolean("Y", true), 1);
  EXPECT_EQ(culture.match_boolean("n", true), 0);
  EXPECT_EQ(culture.match_boolean("J", true), 1);
}

TEST(CultureTest, CustomLiteralLists) {
  CultureConfig culture = CultureConfig::invariant();
  culture.true_values = "oui, si";
  culture.false_values = "non";
  EXPECT_EQ(culture.match_boolean("si", false), 1);
  EXPECT_EQ(culture.match_boolean("NON", false), 0);
  EXPECT_EQ(culture.match_boolean("true", false), -1);
}

TEST(CultureTest, TrimAndCompareHelpers) {
  EXPECT_EQ(trim_whitespace("  abc \t\n"), "abc");
  EXPECT_EQ(trim_whitespace("   "), "");
  EXPECT_TRUE(iequals("MiXeD", "mixed"));
  EXPECT_FALSE(iequals("abc", "abcd"));
}

TEST(ExplicitDateTest, FormatList) {
  GuessSettings settings;
  EXPECT_FALSE(settings.is_explicit_date("20240115"));
  settings.explicit_date_formats = {"%Y%m%d"};
  EXPECT_TRUE(settings.is_explicit_date("20240115"));
  EXPECT_FALSE(settings.is_explicit_date("20241315"));
}

TEST(ExplicitDateTest, PredicateOverridesFormats) {
  GuessSettings settings;
  settings.explicit_date_formats = {"%Y%m%d"};
  settings.explicit_date_predicate = [](std::string_view, const GuessSettings&) { return false; };
  EXPECT_FALSE(settings.is_explicit_date("20240115"));
}

TEST(ExplicitDateTest, CompactDatePolicy) {
  GuessSettings settings;
  EXPECT_TRUE(is_compact_date("20240229", settings));
  EXPECT_FALSE(is_compact_date("20230229", settings));
  EXPECT_FALSE(is_compact_date("2024011", settings));
  EXPECT_FALSE(is_compact_date("2024-1-1", settings));
  EXPECT_FALSE(is_compact_date("12345678", settings));
}

TEST(Utf8LengthTest, CountsCodePoints) {
  TextLength ascii = utf8_length("hello");
  EXPECT_EQ(ascii.code_points, 5u);
  EXPECT_EQ(ascii.non_ascii, 0u);

  TextLength accented = utf8_length("h\xC3\xA9llo"); // héllo
  EXPECT_EQ(accented.code_points, 5u);
  EXPECT_EQ(accented.non_ascii, 1u);

  TextLength cjk = utf8_length("\xE6\x97\xA5\xE6\x9C\xAC"); // 日本
  EXPECT_EQ(cjk.code_points, 2u);
  EXPECT_EQ(cjk.non_ascii, 2u);
}

TEST(Utf8LengthTest, MalformedInputTerminates) {
  TextLength broken = utf8_length(std::string("a\xC3", 2));
  EXPECT_EQ(broken.code_points, 2u);
}
