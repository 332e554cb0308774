#include "typeguesser/culture.h"

#include <cctype>

namespace typeguesser {

namespace {

// Walks a comma-separated list and reports whether value matches an entry.
bool list_contains(std::string_view list, std::string_view value, bool allow_single_char) {
  size_t start = 0;
  while (start < list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string_view::npos)
      end = list.size();
    std::string_view entry = trim_whitespace(list.substr(start, end - start));
    if (!entry.empty() && (allow_single_char || entry.size() > 1) && iequals(entry, value))
      return true;
    start = end + 1;
  }
  return false;
}

} // namespace

CultureConfig CultureConfig::invariant() {
  CultureConfig culture;
  culture.month_abbr = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  culture.month_full = {"January", "February", "March",     "April",
                        "May",     "June",     "July",      "August",
                        "September", "October", "November", "December"};
  culture.day_abbr = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  culture.am_pm = {"AM", "PM"};
  culture.decimal_mark = '.';
  culture.thousands_sep = ',';
  culture.date_order = DateFormatPreference::MONTH_FIRST;
  return culture;
}

CultureConfig CultureConfig::european() {
  CultureConfig culture = invariant();
  culture.decimal_mark = ',';
  culture.thousands_sep = '.';
  culture.date_order = DateFormatPreference::DAY_FIRST;
  return culture;
}

int CultureConfig::match_boolean(std::string_view value, bool allow_single_char) const {
  value = trim_whitespace(value);
  if (value.empty())
    return -1;
  if (list_contains(true_values, value, allow_single_char))
    return 1;
  if (list_contains(false_values, value, allow_single_char))
    return 0;
  return -1;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

std::string_view trim_whitespace(std::string_view value) {
  size_t start = 0;
  size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start])))
    ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])))
    --end;
  return value.substr(start, end - start);
}

} // namespace typeguesser
