#pragma once

#include "size.h"
#include "types.h"

#include <cstdint>
#include <string>

namespace typeguesser {

class DeciderRegistry;

// What DatabaseTypeRequest::max does with two types that cannot widen into
// one another.
enum class TypeConflictPolicy : uint8_t {
  WIDEN_TO_STRING = 0, ///< Fall back to STRING, as a Guesser would
  STRICT = 1           ///< Throw GuessException(INCOMPATIBLE_TYPES)
};

/**
 * @brief Immutable result of a guess: a storage type and the size needed to
 * hold every value seen.
 *
 * @example
 * @code
 * typeguesser::Guesser guesser;
 * guesser.adjust_to_compensate_for_values(std::vector<std::string>{"1", "2.5"});
 * auto request = guesser.guess();
 * // request.type() == TypeTag::DECIMAL, request.size().precision() == 2
 * @endcode
 */
class DatabaseTypeRequest {
public:
  // STRING with zero size: the widest safe answer when nothing was seen.
  DatabaseTypeRequest() = default;

  DatabaseTypeRequest(TypeTag type, const Size& size, bool unicode = false)
      : type_(type), size_(size), unicode_(unicode) {}

  TypeTag type() const { return type_; }
  const Size& size() const { return size_; }

  // Set when any non-ASCII text was seen.
  bool unicode() const { return unicode_; }

  // Shorthands for decimal(precision, scale) and varchar(width) columns.
  uint32_t precision() const { return size_.precision(); }
  uint32_t scale() const { return size_.scale(); }
  uint32_t width() const { return size_.string_length; }

  bool operator==(const DatabaseTypeRequest& other) const = default;

  // e.g. "DECIMAL(5,2) width=6"
  std::string to_string() const;

  /**
   * @brief Smallest request covering both inputs, using the same widening
   * lattice a Guesser applies.
   *
   * Both inputs must have a decider in the registry.
   *
   * @throws GuessException with INCOMPATIBLE_TYPES when the types share no
   *         widening path and policy is STRICT.
   * @throws GuessException with UNSUPPORTED_TYPE when a type has no decider.
   */
  static DatabaseTypeRequest max(const DatabaseTypeRequest& first,
                                 const DatabaseTypeRequest& second,
                                 TypeConflictPolicy policy = TypeConflictPolicy::WIDEN_TO_STRING);

  static DatabaseTypeRequest max(const DatabaseTypeRequest& first,
                                 const DatabaseTypeRequest& second, TypeConflictPolicy policy,
                                 const DeciderRegistry& registry);

private:
  TypeTag type_ = TypeTag::STRING;
  Size size_;
  bool unicode_ = false;
};

} // namespace typeguesser
