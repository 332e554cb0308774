#pragma once

#include <algorithm>
#include <cstdint>

namespace typeguesser {

/**
 * @brief Width metadata accreted while observing a column.
 *
 * Size is a plain value type. Every operation returns a new Size whose
 * fields are at least as large as the corresponding fields of its inputs,
 * which makes accretion monotone and combine() commutative and associative.
 *
 * - integer_digits: digits before the decimal separator (sign excluded)
 * - fractional_digits: digits after the decimal separator (the scale)
 * - string_length: longest rendering seen, in characters
 */
struct Size {
  uint32_t integer_digits = 0;
  uint32_t fractional_digits = 0;
  uint32_t string_length = 0;

  constexpr Size grow_numeric(uint32_t integer, uint32_t fractional) const {
    return {std::max(integer_digits, integer), std::max(fractional_digits, fractional),
            string_length};
  }

  constexpr Size grow_length(uint32_t length) const {
    return {integer_digits, fractional_digits, std::max(string_length, length)};
  }

  constexpr Size combine(const Size& other) const {
    return {std::max(integer_digits, other.integer_digits),
            std::max(fractional_digits, other.fractional_digits),
            std::max(string_length, other.string_length)};
  }

  // Total significant digits, as used for decimal(precision, scale).
  constexpr uint32_t precision() const { return integer_digits + fractional_digits; }
  constexpr uint32_t scale() const { return fractional_digits; }

  // Characters needed to render the numeric part: digits plus separator.
  // A fraction is always rendered with a leading digit ("0.5").
  constexpr uint32_t numeric_string_length() const {
    if (fractional_digits == 0)
      return integer_digits;
    return std::max(integer_digits, 1u) + fractional_digits + 1;
  }

  constexpr bool empty() const {
    return integer_digits == 0 && fractional_digits == 0 && string_length == 0;
  }

  // True when every field of this is >= the matching field of other.
  constexpr bool covers(const Size& other) const {
    return integer_digits >= other.integer_digits &&
           fractional_digits >= other.fractional_digits && string_length >= other.string_length;
  }

  constexpr bool operator==(const Size& other) const = default;
};

} // namespace typeguesser
