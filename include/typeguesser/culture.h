#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace typeguesser {

/**
 * @brief Order of the day and month fields in ambiguous dates.
 *
 * Dates such as 01/02/2024 are valid both ways; this picks which format
 * list the date/time decider tries. Year-first (ISO) layouts are accepted
 * under every preference.
 */
enum class DateFormatPreference : uint8_t {
  MONTH_FIRST = 0, ///< MM/DD/YYYY
  DAY_FIRST = 1,   ///< DD/MM/YYYY
  ISO_ONLY = 2     ///< Only YYYY-MM-DD (or YYYY/MM/DD) layouts
};

inline const char* date_format_preference_name(DateFormatPreference pref) {
  switch (pref) {
  case DateFormatPreference::MONTH_FIRST:
    return "MONTH_FIRST";
  case DateFormatPreference::DAY_FIRST:
    return "DAY_FIRST";
  case DateFormatPreference::ISO_ONLY:
    return "ISO_ONLY";
  default:
    return "UNKNOWN";
  }
}

// Locale data used when interpreting free text. Pure data: every decider
// receives it explicitly, no process-wide locale is consulted.
struct CultureConfig {
  char decimal_mark = '.';
  char thousands_sep = ',';
  bool allow_thousands_sep = true;
  DateFormatPreference date_order = DateFormatPreference::MONTH_FIRST;

  std::vector<std::string> month_abbr; // 12 entries: Jan, Feb, ...
  std::vector<std::string> month_full; // 12 entries: January, February, ...
  std::vector<std::string> day_abbr;   // 7 entries: Sun, Mon, ...
  std::vector<std::string> am_pm;      // 2 entries: AM, PM

  // Comma-separated, matched case-insensitively after trimming.
  std::string true_values = "true,yes,t,y,j,ja,.t.";
  std::string false_values = "false,no,f,n,nein,.f.";

  // Locale-neutral defaults (English names, '.' decimal mark, month first).
  static CultureConfig invariant();

  // Day-first dates, ',' decimal mark and '.' thousands separator.
  static CultureConfig european();

  // Returns 1 for a true literal, 0 for a false literal, -1 otherwise.
  // Single-character literals only count when allow_single_char is set.
  int match_boolean(std::string_view value, bool allow_single_char) const;
};

// Case-insensitive ASCII comparison.
bool iequals(std::string_view a, std::string_view b);

// Strips leading and trailing ASCII whitespace.
std::string_view trim_whitespace(std::string_view value);

} // namespace typeguesser
