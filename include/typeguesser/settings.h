#pragma once

#include "culture.h"
#include "debug.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace typeguesser {

struct GuessSettings;

/**
 * @brief What a Guesser does when two typed values from incompatible
 * families arrive (for example a bool after an int).
 */
enum class HardTypedConflictPolicy : uint8_t {
  FAIL = 0,              ///< Raise MixedTypingException (TYPED_FAMILY_CONFLICT)
  FALLBACK_TO_STRING = 1 ///< Widen to STRING as free text would
};

// Decides whether a string is an explicit date that the numeric deciders
// must leave to the date/time decider. A claimed value that no known date
// layout can read is classified as a string.
using ExplicitDatePredicate = std::function<bool(std::string_view, const GuessSettings&)>;

/**
 * @brief Configuration threaded through every decider call.
 *
 * Settings may be changed between ingestions. A GuesserPool restores the
 * defaults when a guesser is returned.
 *
 * @example
 * @code
 * typeguesser::GuessSettings settings;
 * settings.culture = typeguesser::CultureConfig::european();
 * settings.explicit_date_formats = {"%Y%m%d"};
 * typeguesser::Guesser guesser(settings);
 * @endcode
 */
struct GuessSettings {
  CultureConfig culture = CultureConfig::invariant();

  // Accept single letters (Y/N, T/F, J) as booleans.
  bool char_can_be_boolean = false;

  // strptime-style formats (%Y %y %m %d %b %B %H %I %M %S %p) that mark a
  // string as a date even when it would also parse as a number.
  std::vector<std::string> explicit_date_formats;

  // Overrides the format-list check above when set.
  ExplicitDatePredicate explicit_date_predicate;

  HardTypedConflictPolicy hard_typed_conflict = HardTypedConflictPolicy::FAIL;

  // Added to the string length for each non-ASCII code point.
  uint32_t extra_length_per_non_ascii = 0;

  DebugConfig debug;

  static GuessSettings defaults() { return GuessSettings(); }

  // Runs the explicit-date predicate, or the format list when none is set.
  bool is_explicit_date(std::string_view value) const;
};

// Ready-made predicate: exactly eight digits forming a valid YYYYMMDD date.
bool is_compact_date(std::string_view value, const GuessSettings& settings);

} // namespace typeguesser
