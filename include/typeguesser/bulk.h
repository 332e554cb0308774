#pragma once

#include "culture.h"
#include "database_type_request.h"
#include "registry.h"
#include "types.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace typeguesser {

// Guesses for whole columns of typed values at once. Each runs the same
// decider lookup and merge as Guesser in the hard-typed regime, without
// allocating. An empty column gives STRING with zero size.
DatabaseTypeRequest guess_integers(std::span<const int32_t> values,
                                   const DeciderRegistry& registry = DeciderRegistry::shared());
DatabaseTypeRequest guess_integers(std::span<const int64_t> values,
                                   const DeciderRegistry& registry = DeciderRegistry::shared());
DatabaseTypeRequest guess_decimals(std::span<const Decimal> values,
                                   const DeciderRegistry& registry = DeciderRegistry::shared());
DatabaseTypeRequest guess_booleans(std::span<const bool> values,
                                   const DeciderRegistry& registry = DeciderRegistry::shared());

/**
 * @brief Picks the date order that best explains a set of sample strings.
 *
 * Samples that parse under the culture's own order (or as ISO 8601) leave
 * it in place. The rest vote for whichever of day-first and month-first
 * accepts them; a majority for the other order wins. Blank samples are
 * ignored.
 *
 * @return culture.date_order unless the votes clearly favour the other order.
 */
DateFormatPreference guess_date_format(std::span<const std::string_view> samples,
                                       const CultureConfig& culture);
DateFormatPreference guess_date_format(const std::vector<std::string>& samples,
                                       const CultureConfig& culture);

} // namespace typeguesser
