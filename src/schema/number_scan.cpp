#include "typeguesser/number_scan.h"

#include <cstdlib>
#include <fast_float/fast_float.h>
#include <limits>

namespace typeguesser {

static const uint64_t powers_of_ten[] = {1ULL,
                                         10ULL,
                                         100ULL,
                                         1000ULL,
                                         10000ULL,
                                         100000ULL,
                                         1000000ULL,
                                         10000000ULL,
                                         100000000ULL,
                                         1000000000ULL,
                                         10000000000ULL,
                                         100000000000ULL,
                                         1000000000000ULL,
                                         10000000000000ULL,
                                         100000000000000ULL,
                                         1000000000000000ULL,
                                         10000000000000000ULL,
                                         100000000000000000ULL,
                                         1000000000000000000ULL,
                                         10000000000000000000ULL};

uint32_t count_digits(uint64_t v) {
  uint32_t digits = 1;
  while (digits < 20 && v >= powers_of_ten[digits])
    ++digits;
  return digits;
}

static uint64_t magnitude(int64_t v) {
  // Negate in unsigned arithmetic so INT64_MIN does not overflow
  return v < 0 ? uint64_t(0) - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
}

void decimal_digits(const Decimal& d, uint32_t& integer_digits, uint32_t& fractional_digits) {
  uint64_t mag = magnitude(d.unscaled);
  if (d.scale <= 0) {
    integer_digits = count_digits(mag) + (mag == 0 ? 0 : static_cast<uint32_t>(-d.scale));
    fractional_digits = 0;
    return;
  }
  fractional_digits = static_cast<uint32_t>(d.scale);
  uint64_t whole = d.scale < 20 ? mag / powers_of_ten[d.scale] : 0;
  integer_digits = whole == 0 ? 0 : count_digits(whole);
}

// Walks [sign] digits [sep digits...] and reports where the integer part ends.
// Grouping is validated here so both scanners share one rule.
static bool scan_integer_part(std::string_view s, const CultureConfig& culture, size_t& pos,
                              size_t& digit_count) {
  size_t group_len = 0;
  bool grouped = false;
  digit_count = 0;
  while (pos < s.size()) {
    char c = s[pos];
    if (c >= '0' && c <= '9') {
      ++group_len;
      ++digit_count;
    } else if (culture.allow_thousands_sep && c == culture.thousands_sep &&
               c != culture.decimal_mark) {
      if (group_len == 0)
        return false;
      if (!grouped) {
        if (group_len > 3)
          return false;
        grouped = true;
      } else if (group_len != 3) {
        return false;
      }
      group_len = 0;
    } else {
      break;
    }
    ++pos;
  }
  return !grouped || group_len == 3;
}

bool scan_integer(std::string_view s, const CultureConfig& culture, ScannedInteger& out) {
  if (s.empty())
    return false;

  size_t pos = 0;
  bool negative = false;
  if (s[0] == '-' || s[0] == '+') {
    negative = (s[0] == '-');
    pos = 1;
  }

  size_t start = pos;
  size_t digit_count = 0;
  if (!scan_integer_part(s, culture, pos, digit_count))
    return false;
  if (digit_count == 0 || pos != s.size())
    return false;

  uint64_t mag = 0;
  for (size_t i = start; i < s.size(); ++i) {
    unsigned d = static_cast<unsigned char>(s[i]) - '0';
    if (d > 9)
      continue; // thousands separator
    if (mag > (std::numeric_limits<uint64_t>::max() - d) / 10)
      return false;
    mag = mag * 10 + d;
  }

  const uint64_t limit = negative ? uint64_t(1) << 63
                                  : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (mag > limit)
    return false;

  out.value = negative ? static_cast<int64_t>(uint64_t(0) - mag) : static_cast<int64_t>(mag);
  out.digits = count_digits(mag);
  return true;
}

bool scan_decimal(std::string_view s, const CultureConfig& culture, ScannedDecimal& out) {
  // Normalised copy for fast_float: no grouping, no leading '+' and no
  // leading zeros, so only significant text counts against the buffer
  char buf[64];
  size_t len = 0;
  auto put = [&](char c) {
    if (len == sizeof(buf))
      return false;
    buf[len++] = c;
    return true;
  };
  if (s.empty())
    return false;

  size_t pos = 0;
  bool negative = false;
  if (s[0] == '-' || s[0] == '+') {
    negative = (s[0] == '-');
    if (negative)
      buf[len++] = '-';
    pos = 1;
  }

  size_t int_start = pos;
  size_t int_digits = 0;
  if (!scan_integer_part(s, culture, pos, int_digits))
    return false;
  size_t int_end = pos;
  bool leading = true;
  for (size_t i = int_start; i < int_end; ++i) {
    if (s[i] < '0' || s[i] > '9' || (leading && s[i] == '0'))
      continue;
    leading = false;
    if (!put(s[i]))
      return false;
  }
  if (leading && int_digits > 0 && !put('0'))
    return false;

  size_t frac_start = pos;
  size_t frac_digits = 0;
  if (pos < s.size() && s[pos] == culture.decimal_mark) {
    if (!put(s[pos]))
      return false;
    ++pos;
    frac_start = pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (!put(s[pos]))
        return false;
      ++pos;
      ++frac_digits;
    }
  }
  if (int_digits + frac_digits == 0)
    return false;

  int exponent = 0;
  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    if (!put(s[pos]))
      return false;
    ++pos;
    bool exp_negative = false;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) {
      exp_negative = (s[pos] == '-');
      if (!put(s[pos]))
        return false;
      ++pos;
    }
    size_t exp_start = pos;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (exponent > 1000 || !put(s[pos]))
        return false;
      exponent = exponent * 10 + (s[pos] - '0');
      ++pos;
    }
    if (pos == exp_start)
      return false;
    if (exp_negative)
      exponent = -exponent;
  }
  if (pos != s.size())
    return false;

  double parsed;
  fast_float::parse_options options{fast_float::chars_format::general, culture.decimal_mark};
  auto [ptr, ec] = fast_float::from_chars_advanced(buf, buf + len, parsed, options);
  if (ec != std::errc() || ptr != buf + len)
    return false;

  // Exact digits: integer part without leading zeros, then every fraction digit
  uint64_t unscaled = 0;
  uint32_t significant = 0;
  auto push_digit = [&](char c) {
    unsigned d = static_cast<unsigned>(c - '0');
    if (significant == 0 && d == 0)
      return true;
    if (++significant > MAX_DECIMAL_DIGITS)
      return false;
    unscaled = unscaled * 10 + d;
    return true;
  };
  for (size_t i = int_start; i < int_end; ++i) {
    if (s[i] >= '0' && s[i] <= '9' && !push_digit(s[i]))
      return false;
  }
  for (size_t i = frac_start; i < frac_start + frac_digits; ++i) {
    if (!push_digit(s[i]))
      return false;
  }

  int scale = static_cast<int>(frac_digits) - exponent;
  if (scale < 0) {
    if (unscaled != 0) {
      if (significant + static_cast<uint32_t>(-scale) > MAX_DECIMAL_DIGITS)
        return false;
      unscaled *= powers_of_ten[-scale];
    }
    scale = 0;
  }
  if (scale > static_cast<int>(MAX_DECIMAL_DIGITS))
    return false;

  out.value.unscaled = negative ? -static_cast<int64_t>(unscaled) : static_cast<int64_t>(unscaled);
  out.value.scale = scale;
  decimal_digits(out.value, out.integer_digits, out.fractional_digits);
  return true;
}

double Decimal::to_double() const {
  double result = static_cast<double>(unscaled);
  if (scale > 0) {
    for (int32_t i = 0; i < scale; ++i)
      result /= 10.0;
  } else {
    for (int32_t i = scale; i < 0; ++i)
      result *= 10.0;
  }
  return result;
}

} // namespace typeguesser
