#pragma once

#include "database_type_request.h"
#include "registry.h"
#include "settings.h"
#include "size.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace typeguesser {

// Which kind of input a Guesser has locked onto.
enum class InputRegime : uint8_t {
  UNSET = 0,     ///< Nothing but nulls seen yet
  STRING = 1,    ///< Free text, classified by scanning the deciders
  HARD_TYPED = 2 ///< Typed scalars, looked up directly by kind
};

inline const char* input_regime_name(InputRegime regime) {
  switch (regime) {
  case InputRegime::UNSET:
    return "UNSET";
  case InputRegime::STRING:
    return "STRING";
  case InputRegime::HARD_TYPED:
    return "HARD_TYPED";
  default:
    return "UNKNOWN";
  }
}

/**
 * @brief Incrementally infers the narrowest storage type and size for one
 * stream of values.
 *
 * Values are fed one at a time, either as text or as already-typed scalars,
 * and guess() may be read at any point. The estimate only ever grows: every
 * value accepted so far stays representable by the current guess. Once the
 * estimate falls back to STRING it stays there until reset().
 *
 * A Guesser locks onto the first kind of input it sees. Text after typed
 * scalars, or typed scalars after text, throws MixedTypingException; call
 * reset() to switch.
 *
 * Null, empty and whitespace-only inputs are counted but never change the
 * estimate. A call that throws leaves the Guesser exactly as it was.
 *
 * @note Thread Safety: a Guesser is not thread-safe. Use one per thread, or
 *       check them out of a GuesserPool. The DeciderRegistry it reads is
 *       shared safely.
 *
 * @example
 * @code
 * typeguesser::Guesser guesser;
 * guesser.adjust_to_compensate_for_value("12");
 * guesser.adjust_to_compensate_for_value("3.75");
 * auto request = guesser.guess();
 * // request.type() == TypeTag::DECIMAL, precision 4, scale 2
 * @endcode
 */
class Guesser {
public:
  Guesser();
  explicit Guesser(const GuessSettings& settings);
  Guesser(const GuessSettings& settings, const DeciderRegistry& registry);

  /**
   * @brief Starts from a known estimate instead of an empty one.
   *
   * The hint's type and size count as already seen, so later values can
   * widen it but never shrink it. No input regime is locked and the value
   * count stays zero. reset() drops the hint.
   *
   * @throws GuessException with UNSUPPORTED_TYPE when the registry has no
   *         decider for the hinted type.
   */
  explicit Guesser(const DatabaseTypeRequest& hint, const GuessSettings& settings = GuessSettings(),
                   const DeciderRegistry& registry = DeciderRegistry::shared());

  // Typed value, text view or null. Text views are classified as strings.
  void adjust_to_compensate_for_value(const Value& value);
  void adjust_to_compensate_for_value(std::string_view value);
  void adjust_to_compensate_for_value(const std::string& value) {
    adjust_to_compensate_for_value(std::string_view(value));
  }
  // A null pointer is a null value.
  void adjust_to_compensate_for_value(const char* value);
  void adjust_to_compensate_for_value(std::nullptr_t) { ++null_count_; }

  // Plain integers and bools, so that a literal 0 is an int and not a null
  // pointer.
  template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
  void adjust_to_compensate_for_value(T value) {
    adjust_to_compensate_for_value(Value(value));
  }

  template <typename InputIt> void adjust_to_compensate_for_values(InputIt first, InputIt last) {
    for (; first != last; ++first)
      adjust_to_compensate_for_value(*first);
  }

  template <typename Container> void adjust_to_compensate_for_values(const Container& values) {
    adjust_to_compensate_for_values(std::begin(values), std::end(values));
  }

  // Current estimate. STRING with zero size before any non-null value.
  DatabaseTypeRequest guess() const;

  /**
   * @brief Parses text as the current estimate.
   *
   * Empty and whitespace-only text parses to null. Before any value is seen
   * the estimate is STRING and the text is returned unchanged.
   *
   * @throws GuessException with PARSE_FAILURE when the estimate rejects it.
   */
  Scalar parse(std::string_view candidate) const;

  // Non-throwing variant of parse().
  Result<Scalar> try_parse(std::string_view candidate) const;

  // Forgets every value seen. Settings are kept.
  void reset();

  const GuessSettings& settings() const { return settings_; }
  GuessSettings& settings() { return settings_; }
  void set_settings(const GuessSettings& settings) { settings_ = settings; }

  const DeciderRegistry& registry() const { return *registry_; }

  // The decider behind the current estimate; null until a value is seen.
  const TypeDecider* current_decider() const { return current_; }

  InputRegime regime() const { return regime_; }
  bool is_primed_with_typed_values() const { return regime_ == InputRegime::HARD_TYPED; }

  // Non-null values accepted, and nulls skipped.
  size_t value_count() const { return value_count_; }
  size_t null_count() const { return null_count_; }

private:
  void commit(const TypeDecider& decider, const Size& value_size, InputRegime regime,
              bool unicode);

  const DeciderRegistry* registry_;
  GuessSettings settings_;

  const TypeDecider* current_ = nullptr;
  Size size_;
  InputRegime regime_ = InputRegime::UNSET;
  // Widest canonical rendering of any value seen, used on String fallback.
  uint32_t fallback_length_ = 0;
  bool unicode_ = false;
  size_t value_count_ = 0;
  size_t null_count_ = 0;
};

} // namespace typeguesser
