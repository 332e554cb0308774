#pragma once

#include "culture.h"

#include <cstdint>
#include <string_view>

namespace typeguesser {

/**
 * @brief Calendar and clock fields read from one value.
 *
 * Fields a layout does not mention keep their defaults, so a time-only
 * layout leaves the date unset (year == -1).
 */
struct ParsedDateTime {
  int year = -1;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int microsecond = 0;
  int am_pm = -1; // -1 unset, 0 AM, 1 PM
  int utc_offset_minutes = 0;

  bool is_valid_date() const;
  bool is_valid_time() const;

  // Hour on the 24-hour clock once any AM/PM marker is applied.
  int effective_hour() const;

  // Proleptic Gregorian day number, 1970-01-01 == 0.
  int64_t to_days_since_epoch() const;

  // UTC instant, with the offset removed.
  int64_t to_micros_since_epoch() const;
};

/**
 * @brief strptime-style date/time reader.
 *
 * Supported directives: %Y %y %m %d %e %b %B %a %H %I %M %S %p %z %F %T %R
 * and %%. A blank in the layout matches any run of blanks (including none).
 * The whole value must be consumed, and when the layout names any date
 * field the result must be a real calendar day.
 *
 * Month, weekday and AM/PM names come from the culture, which must outlive
 * the parser. parse() is const and keeps all state in its output, so one
 * parser may be used from several threads.
 */
class FormatParser {
public:
  explicit FormatParser(const CultureConfig& culture) : culture_(culture) {}

  bool parse(std::string_view value, std::string_view layout, ParsedDateTime& out) const;

  // YYYY-MM-DD or YYYY/MM/DD, then optionally 'T' or a blank, HH:MM[:SS[.f]]
  // and a Z or +HH[:MM] offset.
  bool parse_iso8601(std::string_view value, ParsedDateTime& out) const;

  const CultureConfig& culture() const { return culture_; }

private:
  const CultureConfig& culture_;
};

} // namespace typeguesser
