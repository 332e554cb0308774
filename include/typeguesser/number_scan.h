#pragma once

#include "culture.h"
#include "types.h"

#include <cstdint>
#include <string_view>

namespace typeguesser {

// Largest number of significant digits a Decimal can hold exactly.
constexpr uint32_t MAX_DECIMAL_DIGITS = 18;

struct ScannedInteger {
  int64_t value = 0;
  uint32_t digits = 0; // significant digits, sign excluded
};

struct ScannedDecimal {
  Decimal value;
  uint32_t integer_digits = 0;
  uint32_t fractional_digits = 0;
};

// Optional sign, digits, and thousands grouping when the culture allows it
// (first group 1-3 digits, then groups of exactly 3). Must fit int64.
bool scan_integer(std::string_view trimmed, const CultureConfig& culture, ScannedInteger& out);

// Integer syntax plus an optional decimal mark and fraction, and an optional
// exponent. Trailing fractional zeros count towards the scale. Rejects values
// needing more than MAX_DECIMAL_DIGITS digits.
bool scan_decimal(std::string_view trimmed, const CultureConfig& culture, ScannedDecimal& out);

// Number of decimal digits in v; 1 for zero.
uint32_t count_digits(uint64_t v);

// Digits before the separator (0 for |d| < 1 with a non-zero scale) and
// digits after it.
void decimal_digits(const Decimal& d, uint32_t& integer_digits, uint32_t& fractional_digits);

} // namespace typeguesser
