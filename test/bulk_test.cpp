/**
 * @file bulk_test.cpp
 * @brief Tests for whole-column helpers.
 */

#include "typeguesser/bulk.h"
#include "typeguesser/error.h"
#include "typeguesser/guesser.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace typeguesser;

// ============================================================================
// Typed columns
// ============================================================================

TEST(BulkTest, Int32Column) {
  std::vector<int32_t> values = {1, -22, 333};
  DatabaseTypeRequest request = guess_integers(values);
  EXPECT_EQ(request.type(), TypeTag::INTEGER);
  EXPECT_EQ(request.size().integer_digits, 3u);
  EXPECT_EQ(request.width(), 3u);
}

TEST(BulkTest, Int64ColumnMatchesGuesser) {
  std::vector<int64_t> values = {0, 9000000000LL, -7};
  Guesser guesser;
  guesser.adjust_to_compensate_for_values(values);
  EXPECT_EQ(guess_integers(values), guesser.guess());
  EXPECT_EQ(guess_integers(values).size().integer_digits, 10u);
}

TEST(BulkTest, DecimalColumn) {
  std::vector<Decimal> values = {{12345, 2}, {-5, 1}};
  DatabaseTypeRequest request = guess_decimals(values);
  EXPECT_EQ(request.type(), TypeTag::DECIMAL);
  EXPECT_EQ(request.precision(), 5u);
  EXPECT_EQ(request.scale(), 2u);
  // "123.45" is the longest rendering
  EXPECT_EQ(request.width(), 6u);
}

TEST(BulkTest, BooleanColumn) {
  const bool values[] = {true, false, true};
  DatabaseTypeRequest request = guess_booleans(values);
  EXPECT_EQ(request.type(), TypeTag::BOOLEAN);
  EXPECT_EQ(request.width(), 5u);
}

TEST(BulkTest, EmptyColumnIsString) {
  std::vector<int32_t> none;
  EXPECT_EQ(guess_integers(none), DatabaseTypeRequest());
  EXPECT_EQ(guess_decimals(std::span<const Decimal>()), DatabaseTypeRequest());
}

TEST(BulkTest, MissingDeciderIsUnsupported) {
  std::vector<std::unique_ptr<TypeDecider>> deciders;
  for (auto& decider : DeciderRegistry::default_deciders()) {
    if (decider->type() != TypeTag::BOOLEAN)
      deciders.push_back(std::move(decider));
  }
  DeciderRegistry registry(std::move(deciders), DeciderRegistry::default_widenings());

  const bool values[] = {true};
  try {
    guess_booleans(values, registry);
    FAIL() << "Expected GuessException";
  } catch (const GuessException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_TYPE);
  }
}

// ============================================================================
// Date order detection
// ============================================================================

TEST(BulkTest, DateFormatKeepsCultureOrderWhenAllParse) {
  std::vector<std::string> samples = {"01/02/2024", "12/31/2023", "2024-05-06"};
  EXPECT_EQ(guess_date_format(samples, CultureConfig::invariant()),
            DateFormatPreference::MONTH_FIRST);
}

TEST(BulkTest, DateFormatSwitchesToDayFirst) {
  std::vector<std::string> samples = {"25/12/2024", "13/01/2024", "01/02/2024"};
  EXPECT_EQ(guess_date_format(samples, CultureConfig::invariant()),
            DateFormatPreference::DAY_FIRST);
}

TEST(BulkTest, DateFormatSwitchesToMonthFirst) {
  std::vector<std::string> samples = {"12/25/2024", "01/31/2024"};
  EXPECT_EQ(guess_date_format(samples, CultureConfig::european()),
            DateFormatPreference::MONTH_FIRST);
}

TEST(BulkTest, DateFormatIgnoresBlanksAndUnparseable) {
  std::vector<std::string> samples = {"", "   ", "hello"};
  EXPECT_EQ(guess_date_format(samples, CultureConfig::invariant()),
            DateFormatPreference::MONTH_FIRST);
  EXPECT_EQ(guess_date_format(std::vector<std::string>{}, CultureConfig::european()),
            DateFormatPreference::DAY_FIRST);
}
