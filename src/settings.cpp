#include "typeguesser/settings.h"

#include "typeguesser/format_parser.h"

namespace typeguesser {

bool GuessSettings::is_explicit_date(std::string_view value) const {
  if (explicit_date_predicate)
    return explicit_date_predicate(value, *this);
  if (explicit_date_formats.empty())
    return false;

  FormatParser parser(culture);
  ParsedDateTime parsed;
  for (const auto& format : explicit_date_formats) {
    if (parser.parse(value, format, parsed))
      return true;
  }
  return false;
}

bool is_compact_date(std::string_view value, const GuessSettings&) {
  if (value.size() != 8)
    return false;

  int fields[3] = {0, 0, 0};
  const int widths[3] = {4, 2, 2};
  size_t pos = 0;
  for (int f = 0; f < 3; ++f) {
    for (int i = 0; i < widths[f]; ++i, ++pos) {
      unsigned d = static_cast<unsigned char>(value[pos]) - '0';
      if (d > 9)
        return false;
      fields[f] = fields[f] * 10 + static_cast<int>(d);
    }
  }

  ParsedDateTime date;
  date.year = fields[0];
  date.month = fields[1];
  date.day = fields[2];
  return date.is_valid_date();
}

} // namespace typeguesser
