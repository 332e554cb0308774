#pragma once

#include "decider.h"
#include "format_parser.h"

#include <string_view>

namespace typeguesser {

// Width of the canonical "yyyy-MM-dd HH:mm:ss.fffffff" rendering.
constexpr uint32_t DATETIME_STRING_LENGTH = 27;

// Width of "false", the longest boolean rendering.
constexpr uint32_t BOOLEAN_STRING_LENGTH = 5;

// True/false literals from the culture's lists. Digits are never booleans.
class BooleanDecider final : public TypeDecider {
public:
  BooleanDecider();

  void grow_for_scalar(const Value& value, Size& size) const override;

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;
};

// Whole numbers of up to MAX_DECIMAL_DIGITS digits as text; typed values of
// every integer width up to int64.
class IntegerDecider final : public TypeDecider {
public:
  IntegerDecider();

  void grow_for_scalar(const Value& value, Size& size) const override;
  uint32_t canonical_string_length(const Size& size) const override;

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;
};

// Fixed-point numbers of up to MAX_DECIMAL_DIGITS significant digits.
class DecimalDecider final : public TypeDecider {
public:
  DecimalDecider();

  void grow_for_scalar(const Value& value, Size& size) const override;
  uint32_t canonical_string_length(const Size& size) const override;

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;
};

/**
 * @brief Calendar dates with an optional time of day.
 *
 * Accepts, in order:
 * - anything the explicit-date predicate recognises
 * - ISO 8601 (YYYY-MM-DD[Thh:mm[:ss[.fffffff]]][Z|+hh:mm])
 * - the culture's month-first or day-first layouts with / - . or \ as the
 *   separator, numeric or named months, 2 or 4 digit years, and an optional
 *   time (HH:MM, HH:MM:SS, or 12-hour with AM/PM)
 *
 * Numbers and bare times are rejected first: "1.1" is a decimal and "10:30"
 * is a duration, never a date.
 */
class DateTimeDecider final : public TypeDecider {
public:
  DateTimeDecider();

  void grow_for_scalar(const Value& value, Size& size) const override;
  uint32_t canonical_string_length(const Size& size) const override;

  // Tries only the layouts of one date order; used to vote on an order.
  static bool matches_layout(std::string_view trimmed, const CultureConfig& culture,
                             DateFormatPreference order, ParsedDateTime& out);

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;

private:
  static bool parse_any(std::string_view trimmed, const GuessSettings& settings,
                        ParsedDateTime& out);
  // Explicit formats, then compact dates, then parse_any.
  static bool parse_value(std::string_view trimmed, const GuessSettings& settings,
                          ParsedDateTime& out);
};

// Elapsed time as [-][d.]H:MM[:SS[.fffffff]]; hours 0-23.
class DurationDecider final : public TypeDecider {
public:
  DurationDecider();

  void grow_for_scalar(const Value& value, Size& size) const override;

  // Parses the duration grammar; false when the text does not match.
  static bool scan(std::string_view trimmed, Duration& out);

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;
};

// Universal fallback: accepts every string.
class StringDecider final : public TypeDecider {
public:
  StringDecider();

protected:
  bool accept(std::string_view trimmed, const GuessSettings& settings, Size& size) const override;
  bool try_parse(std::string_view candidate, const GuessSettings& settings,
                 Scalar& out) const override;
};

} // namespace typeguesser
