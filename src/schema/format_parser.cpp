#include "typeguesser/format_parser.h"

#include <cctype>
#include <string>
#include <vector>

namespace typeguesser {

static constexpr int64_t MICROS_PER_MINUTE = 60LL * 1000000LL;
static constexpr int64_t MICROS_PER_DAY = 24LL * 60LL * MICROS_PER_MINUTE;

static bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int days_in_month(int year, int month) {
  static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return lengths[month - 1];
}

// ============================================================================
// ParsedDateTime
// ============================================================================

bool ParsedDateTime::is_valid_date() const {
  if (year < 1 || year > 9999 || month < 1 || month > 12)
    return false;
  return day >= 1 && day <= days_in_month(year, month);
}

bool ParsedDateTime::is_valid_time() const {
  int h = effective_hour();
  return h >= 0 && h < 24 && minute >= 0 && minute < 60 && second >= 0 && second < 60 &&
         microsecond >= 0 && microsecond < 1000000;
}

int ParsedDateTime::effective_hour() const {
  // %I stores 12 as 0, so only PM needs shifting
  if (am_pm == 1 && hour < 12)
    return hour + 12;
  return hour;
}

int64_t ParsedDateTime::to_days_since_epoch() const {
  if (!is_valid_date())
    return 0;
  // Civil-from-days inverse over 400-year eras starting in March
  int64_t y = year - (month <= 2 ? 1 : 0);
  int64_t era = (y >= 0 ? y : y - 399) / 400;
  int64_t year_of_era = y - era * 400;
  int64_t day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  int64_t day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * 146097 + day_of_era - 719468;
}

int64_t ParsedDateTime::to_micros_since_epoch() const {
  int64_t minutes = static_cast<int64_t>(effective_hour()) * 60 + minute - utc_offset_minutes;
  return to_days_since_epoch() * MICROS_PER_DAY + minutes * MICROS_PER_MINUTE +
         static_cast<int64_t>(second) * 1000000LL + microsecond;
}

// ============================================================================
// Cursor
// ============================================================================

namespace {

// Read position over one value. Every reader either consumes its token and
// returns true, or leaves the position unspecified and returns false.
class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  bool done() const { return pos_ == text_.size(); }
  char peek() const { return done() ? '\0' : text_[pos_]; }

  void skip_blanks() {
    while (!done() && std::isspace(static_cast<unsigned char>(text_[pos_])))
      ++pos_;
  }

  bool literal(char c) {
    if (peek() != c || done())
      return false;
    ++pos_;
    return true;
  }

  // Between min_digits and max_digits decimal digits, greedy. Consumes
  // nothing on failure.
  bool number(int min_digits, int max_digits, int& out) {
    size_t start = pos_;
    int value = 0;
    int count = 0;
    while (count < max_digits && !done()) {
      unsigned d = static_cast<unsigned char>(text_[pos_]) - '0';
      if (d > 9)
        break;
      value = value * 10 + static_cast<int>(d);
      ++count;
      ++pos_;
    }
    if (count < min_digits) {
      pos_ = start;
      return false;
    }
    out = value;
    return true;
  }

  // Fraction digits after the decimal point, as microseconds. Up to seven
  // digits are read; the seventh is dropped.
  bool fraction(int& micros) {
    int value = 0;
    int count = 0;
    while (count < 7 && !done() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      if (count < 6)
        value = value * 10 + (text_[pos_] - '0');
      ++count;
      ++pos_;
    }
    if (count == 0)
      return false;
    for (int i = count; i < 6; ++i)
      value *= 10;
    micros = value;
    return true;
  }

  // Longest case-insensitive prefix match against names; index is 1-based.
  bool name(const std::vector<std::string>& names, int& index) {
    std::string_view rest = text_.substr(pos_);
    size_t best_length = 0;
    int best = 0;
    for (size_t i = 0; i < names.size(); ++i) {
      const std::string& candidate = names[i];
      if (candidate.empty() || candidate.size() <= best_length || candidate.size() > rest.size())
        continue;
      if (iequals(rest.substr(0, candidate.size()), candidate)) {
        best = static_cast<int>(i) + 1;
        best_length = candidate.size();
      }
    }
    if (best == 0)
      return false;
    pos_ += best_length;
    index = best;
    return true;
  }

  // Z, or +HH / -HH with optional [:]MM.
  bool utc_offset(int& minutes) {
    if (literal('Z')) {
      minutes = 0;
      return true;
    }
    int sign = 1;
    if (literal('-'))
      sign = -1;
    else if (!literal('+'))
      return false;

    int hours = 0;
    if (!number(2, 2, hours))
      return false;
    int mins = 0;
    bool colon = literal(':');
    if (!number(2, 2, mins) && colon)
      return false;
    if (hours > 14 || mins > 59)
      return false;
    minutes = sign * (hours * 60 + mins);
    return true;
  }

  // SS with an optional .fraction.
  bool seconds(int& second, int& micros) {
    if (!number(1, 2, second))
      return false;
    if (peek() == '.') {
      ++pos_;
      return fraction(micros);
    }
    return true;
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

bool names_date_field(char directive) {
  switch (directive) {
  case 'Y':
  case 'y':
  case 'm':
  case 'b':
  case 'B':
  case 'd':
  case 'e':
  case 'F':
    return true;
  default:
    return false;
  }
}

} // namespace

// ============================================================================
// FormatParser
// ============================================================================

bool FormatParser::parse(std::string_view value, std::string_view layout,
                         ParsedDateTime& out) const {
  out = ParsedDateTime{};
  Cursor in(value);
  bool has_date = false;
  in.skip_blanks();

  for (size_t i = 0; i < layout.size(); ++i) {
    char c = layout[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      in.skip_blanks();
      continue;
    }
    if (c != '%') {
      if (!in.literal(c))
        return false;
      continue;
    }
    if (++i == layout.size())
      return false;

    char directive = layout[i];
    has_date = has_date || names_date_field(directive);
    bool ok = true;
    switch (directive) {
    case 'Y':
      ok = in.number(4, 4, out.year);
      break;
    case 'y':
      ok = in.number(2, 2, out.year);
      out.year += out.year < 50 ? 2000 : 1900;
      break;
    case 'm':
      ok = in.number(1, 2, out.month);
      break;
    case 'b':
      ok = in.name(culture_.month_abbr, out.month);
      break;
    case 'B':
      ok = in.name(culture_.month_full, out.month);
      break;
    case 'd':
      ok = in.number(1, 2, out.day);
      break;
    case 'e':
      in.literal(' ');
      ok = in.number(1, 2, out.day);
      break;
    case 'a': {
      int weekday = 0;
      ok = in.name(culture_.day_abbr, weekday);
      break;
    }
    case 'H':
      ok = in.number(1, 2, out.hour) && out.hour < 24;
      break;
    case 'I':
      ok = in.number(1, 2, out.hour) && out.hour >= 1 && out.hour <= 12;
      out.hour %= 12;
      break;
    case 'M':
      ok = in.number(2, 2, out.minute) && out.minute < 60;
      break;
    case 'S':
      ok = in.seconds(out.second, out.microsecond) && out.second < 60;
      break;
    case 'p':
      ok = in.name(culture_.am_pm, out.am_pm);
      --out.am_pm;
      break;
    case 'z':
      ok = in.utc_offset(out.utc_offset_minutes);
      break;
    case 'F':
      ok = in.number(4, 4, out.year) && in.literal('-') && in.number(2, 2, out.month) &&
           in.literal('-') && in.number(2, 2, out.day);
      break;
    case 'R':
      ok = in.number(1, 2, out.hour) && in.literal(':') && in.number(2, 2, out.minute);
      break;
    case 'T':
      ok = in.number(1, 2, out.hour) && in.literal(':') && in.number(2, 2, out.minute) &&
           in.literal(':') && in.seconds(out.second, out.microsecond);
      break;
    case '%':
      ok = in.literal('%');
      break;
    default:
      ok = false;
      break;
    }
    if (!ok)
      return false;
  }

  in.skip_blanks();
  if (!in.done() || !out.is_valid_time())
    return false;
  return !has_date || out.is_valid_date();
}

bool FormatParser::parse_iso8601(std::string_view value, ParsedDateTime& out) const {
  out = ParsedDateTime{};
  Cursor in(value);

  if (!in.number(4, 4, out.year))
    return false;
  char separator = in.peek();
  if (separator != '-' && separator != '/')
    return false;
  if (!in.literal(separator) || !in.number(2, 2, out.month) || !in.literal(separator) ||
      !in.number(2, 2, out.day))
    return false;
  if (!out.is_valid_date())
    return false;
  if (in.done())
    return true;

  if (!in.literal('T') && !in.literal(' '))
    return false;
  if (!in.number(2, 2, out.hour) || !in.literal(':') || !in.number(2, 2, out.minute))
    return false;
  if (in.literal(':')) {
    if (!in.number(2, 2, out.second))
      return false;
    if (in.literal('.') && !in.fraction(out.microsecond))
      return false;
  }
  if (!in.done() && !in.utc_offset(out.utc_offset_minutes))
    return false;

  return in.done() && out.is_valid_time();
}

} // namespace typeguesser
