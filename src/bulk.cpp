#include "typeguesser/bulk.h"

#include "typeguesser/deciders.h"
#include "typeguesser/error.h"
#include "typeguesser/format_parser.h"

#include <algorithm>

namespace typeguesser {

namespace {

// All values share one scalar kind, so they share one decider and the merge
// only ever extends the size.
template <typename T>
DatabaseTypeRequest guess_column(std::span<const T> values, const DeciderRegistry& registry) {
  const TypeDecider* current = nullptr;
  Size size;
  uint32_t fallback_length = 0;

  for (const T& v : values) {
    Value value(v);
    ScalarKind kind = *scalar_kind_of(value);
    const TypeDecider* decider = registry.decider_for_scalar(kind);
    if (!decider)
      throw GuessException(ErrorCode::UNSUPPORTED_TYPE, format_unsupported_type(kind));

    Size value_size;
    decider->grow_for_scalar(value, value_size);
    fallback_length = std::max(fallback_length, decider->canonical_string_length(value_size));
    MergeResult merged = registry.merge(current, size, *decider, value_size, fallback_length);
    current = merged.decider;
    size = merged.size;
  }

  if (!current)
    return DatabaseTypeRequest();
  return DatabaseTypeRequest(current->type(), size);
}

} // namespace

DatabaseTypeRequest guess_integers(std::span<const int32_t> values,
                                   const DeciderRegistry& registry) {
  return guess_column(values, registry);
}

DatabaseTypeRequest guess_integers(std::span<const int64_t> values,
                                   const DeciderRegistry& registry) {
  return guess_column(values, registry);
}

DatabaseTypeRequest guess_decimals(std::span<const Decimal> values,
                                   const DeciderRegistry& registry) {
  return guess_column(values, registry);
}

DatabaseTypeRequest guess_booleans(std::span<const bool> values,
                                   const DeciderRegistry& registry) {
  return guess_column(values, registry);
}

DateFormatPreference guess_date_format(std::span<const std::string_view> samples,
                                       const CultureConfig& culture) {
  FormatParser parser(culture);
  size_t total = 0;
  size_t native = 0;
  size_t day_first = 0;
  size_t month_first = 0;

  for (std::string_view sample : samples) {
    std::string_view trimmed = trim_whitespace(sample);
    if (trimmed.empty())
      continue;
    ++total;

    ParsedDateTime parsed;
    if (parser.parse_iso8601(trimmed, parsed) ||
        DateTimeDecider::matches_layout(trimmed, culture, culture.date_order, parsed)) {
      ++native;
      continue;
    }
    if (DateTimeDecider::matches_layout(trimmed, culture, DateFormatPreference::DAY_FIRST,
                                        parsed))
      ++day_first;
    if (DateTimeDecider::matches_layout(trimmed, culture, DateFormatPreference::MONTH_FIRST,
                                        parsed))
      ++month_first;
  }

  if (native == total)
    return culture.date_order;
  if (day_first > month_first)
    return DateFormatPreference::DAY_FIRST;
  if (month_first > day_first)
    return DateFormatPreference::MONTH_FIRST;
  return culture.date_order;
}

DateFormatPreference guess_date_format(const std::vector<std::string>& samples,
                                       const CultureConfig& culture) {
  std::vector<std::string_view> views(samples.begin(), samples.end());
  return guess_date_format(std::span<const std::string_view>(views), culture);
}

} // namespace typeguesser
