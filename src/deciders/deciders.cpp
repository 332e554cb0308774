#include "typeguesser/deciders.h"

#include "typeguesser/error.h"
#include "typeguesser/number_scan.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace typeguesser {

// ============================================================================
// TypeDecider - shared acceptance/parse plumbing
// ============================================================================

TypeDecider::TypeDecider(TypeTag type, CompatibilityGroup group,
                         std::initializer_list<ScalarKind> kinds)
    : type_(type), group_(group) {
  for (ScalarKind kind : kinds)
    scalar_mask_ |= 1u << static_cast<unsigned>(kind);

  if (scalar_mask_ == 0 && group_ != CompatibilityGroup::TEXTUAL) {
    throw GuessException(ErrorCode::INVALID_DECIDER_CONFIGURATION,
                         format_invalid_decider(std::string("decider for ") + type_name(type) +
                                                " claims no supported scalar kinds"));
  }
}

bool TypeDecider::is_acceptable(std::string_view candidate, const GuessSettings& settings,
                                Size& size) const {
  Size scratch = size;
  if (!accept(trim_whitespace(candidate), settings, scratch))
    return false;
  size = scratch;
  return true;
}

bool TypeDecider::is_acceptable(std::string_view candidate, const GuessSettings& settings) const {
  Size scratch;
  return is_acceptable(candidate, settings, scratch);
}

Scalar TypeDecider::parse(std::string_view candidate, const GuessSettings& settings) const {
  Scalar out;
  if (!is_acceptable(candidate, settings) || !try_parse(candidate, settings, out))
    throw GuessException(ErrorCode::PARSE_FAILURE, format_parse_failure(candidate, type_));
  return out;
}

bool TypeDecider::accepts_scalar(const Value& value) const {
  auto kind = scalar_kind_of(value);
  return kind && accepts_scalar(*kind);
}

void TypeDecider::grow_for_scalar(const Value&, Size&) const {}

uint32_t TypeDecider::canonical_string_length(const Size& size) const {
  return size.string_length;
}

// Sign slot for typed numbers rendered as text.
static uint32_t sign_width(bool negative) { return negative ? 1u : 0u; }

// ============================================================================
// BooleanDecider
// ============================================================================

BooleanDecider::BooleanDecider()
    : TypeDecider(TypeTag::BOOLEAN, CompatibilityGroup::BOOLEAN, {ScalarKind::BOOL}) {}

bool BooleanDecider::accept(std::string_view trimmed, const GuessSettings& settings,
                            Size&) const {
  return settings.culture.match_boolean(trimmed, settings.char_can_be_boolean) >= 0;
}

bool BooleanDecider::try_parse(std::string_view candidate, const GuessSettings& settings,
                               Scalar& out) const {
  int match = settings.culture.match_boolean(candidate, settings.char_can_be_boolean);
  if (match < 0)
    return false;
  out = (match == 1);
  return true;
}

void BooleanDecider::grow_for_scalar(const Value& value, Size& size) const {
  if (auto b = std::get_if<bool>(&value))
    size = size.grow_length(*b ? 4 : BOOLEAN_STRING_LENGTH);
}

// ============================================================================
// IntegerDecider
// ============================================================================

IntegerDecider::IntegerDecider()
    : TypeDecider(TypeTag::INTEGER, CompatibilityGroup::NUMERICAL,
                  {ScalarKind::INT8, ScalarKind::INT16, ScalarKind::INT32, ScalarKind::INT64}) {}

bool IntegerDecider::accept(std::string_view trimmed, const GuessSettings& settings,
                            Size& size) const {
  // Explicit dates such as 20240115 belong to the date/time decider
  if (settings.is_explicit_date(trimmed))
    return false;

  // Capped at the decimal limit so the column stays parseable after widening
  ScannedInteger n;
  if (!scan_integer(trimmed, settings.culture, n) || n.digits > MAX_DECIMAL_DIGITS)
    return false;
  size = size.grow_numeric(n.digits, 0);
  return true;
}

bool IntegerDecider::try_parse(std::string_view candidate, const GuessSettings& settings,
                               Scalar& out) const {
  ScannedInteger n;
  if (!scan_integer(trim_whitespace(candidate), settings.culture, n))
    return false;
  out = n.value;
  return true;
}

void IntegerDecider::grow_for_scalar(const Value& value, Size& size) const {
  int64_t v = 0;
  if (auto p8 = std::get_if<int8_t>(&value))
    v = *p8;
  else if (auto p16 = std::get_if<int16_t>(&value))
    v = *p16;
  else if (auto p32 = std::get_if<int32_t>(&value))
    v = *p32;
  else if (auto p64 = std::get_if<int64_t>(&value))
    v = *p64;
  else
    return;

  uint64_t mag = v < 0 ? uint64_t(0) - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
  uint32_t digits = count_digits(mag);
  size = size.grow_numeric(digits, 0).grow_length(digits + sign_width(v < 0));
}

uint32_t IntegerDecider::canonical_string_length(const Size& size) const {
  return std::max(size.string_length, size.integer_digits);
}

// ============================================================================
// DecimalDecider
// ============================================================================

DecimalDecider::DecimalDecider()
    : TypeDecider(TypeTag::DECIMAL, CompatibilityGroup::NUMERICAL, {ScalarKind::DECIMAL}) {}

bool DecimalDecider::accept(std::string_view trimmed, const GuessSettings& settings,
                            Size& size) const {
  if (settings.is_explicit_date(trimmed))
    return false;

  ScannedDecimal d;
  if (!scan_decimal(trimmed, settings.culture, d))
    return false;
  size = size.grow_numeric(d.integer_digits, d.fractional_digits);
  return true;
}

bool DecimalDecider::try_parse(std::string_view candidate, const GuessSettings& settings,
                               Scalar& out) const {
  ScannedDecimal d;
  if (!scan_decimal(trim_whitespace(candidate), settings.culture, d))
    return false;
  out = d.value;
  return true;
}

void DecimalDecider::grow_for_scalar(const Value& value, Size& size) const {
  auto d = std::get_if<Decimal>(&value);
  if (!d)
    return;
  uint32_t integer_digits = 0;
  uint32_t fractional_digits = 0;
  decimal_digits(*d, integer_digits, fractional_digits);
  Size grown = size.grow_numeric(integer_digits, fractional_digits);
  Size own = Size{}.grow_numeric(integer_digits, fractional_digits);
  size = grown.grow_length(own.numeric_string_length() + sign_width(d->unscaled < 0));
}

uint32_t DecimalDecider::canonical_string_length(const Size& size) const {
  return std::max(size.string_length, size.numeric_string_length());
}

// ============================================================================
// DateTimeDecider
// ============================================================================

namespace {

struct LayoutTable {
  std::vector<std::string> year_first;
  std::vector<std::string> month_first;
  std::vector<std::string> day_first;
  std::vector<std::string> times;
};

const LayoutTable& layouts() {
  static const LayoutTable table = [] {
    LayoutTable t;
    const char* separators[] = {"/", "-", ".", "\\"};
    const char* months[] = {"%m", "%b", "%B"};
    const char* years[] = {"%Y", "%y"};
    for (const char* sep : separators) {
      for (const char* m : months) {
        t.year_first.push_back(std::string("%Y") + sep + m + sep + "%d");
        for (const char* y : years) {
          t.month_first.push_back(std::string(m) + sep + "%d" + sep + y);
          t.day_first.push_back(std::string("%d") + sep + m + sep + y);
        }
      }
    }
    t.times = {"%H:%M", "%H:%M:%S", "%I:%M %p", "%I:%M:%S %p"};
    return t;
  }();
  return table;
}

bool match_any(const FormatParser& parser, std::string_view value,
               const std::vector<std::string>& formats, ParsedDateTime& out) {
  for (const auto& format : formats) {
    if (parser.parse(value, format, out))
      return true;
  }
  return false;
}

} // namespace

DateTimeDecider::DateTimeDecider()
    : TypeDecider(TypeTag::DATETIME, CompatibilityGroup::TEMPORAL, {ScalarKind::DATETIME}) {}

bool DateTimeDecider::matches_layout(std::string_view trimmed, const CultureConfig& culture,
                                     DateFormatPreference order, ParsedDateTime& out) {
  // Date part runs to the first blank; whatever follows must be a time
  size_t split = 0;
  while (split < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[split])))
    ++split;
  std::string_view date_part = trimmed.substr(0, split);
  std::string_view time_part = trim_whitespace(trimmed.substr(split));

  const LayoutTable& table = layouts();
  FormatParser parser(culture);

  ParsedDateTime date;
  bool matched = match_any(parser, date_part, table.year_first, date);
  if (!matched && order == DateFormatPreference::MONTH_FIRST)
    matched = match_any(parser, date_part, table.month_first, date);
  else if (!matched && order == DateFormatPreference::DAY_FIRST)
    matched = match_any(parser, date_part, table.day_first, date);
  if (!matched)
    return false;

  out = date;
  if (time_part.empty())
    return true;

  ParsedDateTime time;
  if (!match_any(parser, time_part, table.times, time))
    return false;
  out.hour = time.hour;
  out.minute = time.minute;
  out.second = time.second;
  out.microsecond = time.microsecond;
  out.am_pm = time.am_pm;
  return true;
}

bool DateTimeDecider::parse_any(std::string_view trimmed, const GuessSettings& settings,
                                ParsedDateTime& out) {
  FormatParser parser(settings.culture);
  if (parser.parse_iso8601(trimmed, out))
    return true;
  return matches_layout(trimmed, settings.culture, settings.culture.date_order, out);
}

bool DateTimeDecider::accept(std::string_view trimmed, const GuessSettings& settings,
                             Size&) const {
  if (trimmed.empty())
    return false;
  // An explicit date still has to be readable by try_parse
  if (settings.is_explicit_date(trimmed)) {
    ParsedDateTime parsed;
    return parse_value(trimmed, settings, parsed);
  }

  // "1.1" is a number and "10:30" a time of day, not dates
  ScannedDecimal number;
  if (scan_decimal(trimmed, settings.culture, number))
    return false;
  Duration duration;
  if (DurationDecider::scan(trimmed, duration))
    return false;

  ParsedDateTime parsed;
  return parse_any(trimmed, settings, parsed);
}

bool DateTimeDecider::try_parse(std::string_view candidate, const GuessSettings& settings,
                                Scalar& out) const {
  ParsedDateTime parsed;
  if (!parse_value(trim_whitespace(candidate), settings, parsed))
    return false;
  out = DateTime{parsed.to_micros_since_epoch()};
  return true;
}

bool DateTimeDecider::parse_value(std::string_view trimmed, const GuessSettings& settings,
                                  ParsedDateTime& out) {
  FormatParser parser(settings.culture);
  if (match_any(parser, trimmed, settings.explicit_date_formats, out))
    return true;
  if (is_compact_date(trimmed, settings) && parser.parse(trimmed, "%Y%m%d", out))
    return true;
  return parse_any(trimmed, settings, out);
}

void DateTimeDecider::grow_for_scalar(const Value& value, Size& size) const {
  if (std::holds_alternative<DateTime>(value))
    size = size.grow_length(DATETIME_STRING_LENGTH);
}

uint32_t DateTimeDecider::canonical_string_length(const Size& size) const {
  return std::max(size.string_length, DATETIME_STRING_LENGTH);
}

// ============================================================================
// DurationDecider
// ============================================================================

static constexpr int64_t MICROS_PER_SECOND = 1000000LL;
static constexpr int64_t MICROS_PER_DAY = 86400LL * MICROS_PER_SECOND;

DurationDecider::DurationDecider()
    : TypeDecider(TypeTag::DURATION, CompatibilityGroup::TEMPORAL, {ScalarKind::DURATION}) {}

bool DurationDecider::scan(std::string_view s, Duration& out) {
  size_t pos = 0;
  bool negative = false;
  if (pos < s.size() && s[pos] == '-') {
    negative = true;
    ++pos;
  }

  auto read_digits = [&](size_t max_digits, int64_t& value) {
    size_t start = pos;
    value = 0;
    while (pos < s.size() && pos - start < max_digits && s[pos] >= '0' && s[pos] <= '9') {
      value = value * 10 + (s[pos] - '0');
      ++pos;
    }
    return pos - start;
  };

  int64_t days = 0;
  int64_t hours = 0;
  size_t n = read_digits(8, hours);
  if (n == 0)
    return false;
  if (pos < s.size() && s[pos] == '.') {
    days = hours;
    ++pos;
    n = read_digits(2, hours);
    if (n == 0)
      return false;
  } else if (n > 2) {
    return false;
  }

  if (pos >= s.size() || s[pos] != ':')
    return false;
  ++pos;
  int64_t minutes = 0;
  if (read_digits(2, minutes) != 2)
    return false;

  int64_t seconds = 0;
  int64_t fraction = 0;
  if (pos < s.size() && s[pos] == ':') {
    ++pos;
    if (read_digits(2, seconds) != 2)
      return false;
    if (pos < s.size() && s[pos] == '.') {
      ++pos;
      size_t frac_digits = read_digits(7, fraction);
      if (frac_digits == 0)
        return false;
      // Scale to 100ns ticks, then truncate to microseconds
      for (size_t i = frac_digits; i < 7; ++i)
        fraction *= 10;
      fraction /= 10;
    }
  }

  if (pos != s.size() || hours > 23 || minutes > 59 || seconds > 59)
    return false;

  int64_t micros = days * MICROS_PER_DAY +
                   ((hours * 60 + minutes) * 60 + seconds) * MICROS_PER_SECOND + fraction;
  out.micros = negative ? -micros : micros;
  return true;
}

bool DurationDecider::accept(std::string_view trimmed, const GuessSettings&, Size&) const {
  Duration d;
  return scan(trimmed, d);
}

bool DurationDecider::try_parse(std::string_view candidate, const GuessSettings&,
                                Scalar& out) const {
  Duration d;
  if (!scan(trim_whitespace(candidate), d))
    return false;
  out = d;
  return true;
}

void DurationDecider::grow_for_scalar(const Value& value, Size& size) const {
  auto d = std::get_if<Duration>(&value);
  if (!d)
    return;
  uint64_t mag = d->micros < 0 ? uint64_t(0) - static_cast<uint64_t>(d->micros)
                               : static_cast<uint64_t>(d->micros);
  uint64_t days = mag / MICROS_PER_DAY;
  uint64_t remainder = mag % MICROS_PER_SECOND;

  // [-][d.]HH:MM:SS[.fffffff]
  uint32_t length = 8 + sign_width(d->micros < 0);
  if (days > 0)
    length += count_digits(days) + 1;
  if (remainder > 0)
    length += 8;
  size = size.grow_length(length);
}

// ============================================================================
// StringDecider
// ============================================================================

StringDecider::StringDecider() : TypeDecider(TypeTag::STRING, CompatibilityGroup::TEXTUAL, {}) {}

bool StringDecider::accept(std::string_view, const GuessSettings&, Size&) const { return true; }

bool StringDecider::try_parse(std::string_view candidate, const GuessSettings&,
                              Scalar& out) const {
  out = std::string(candidate);
  return true;
}

} // namespace typeguesser
