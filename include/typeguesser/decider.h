#pragma once

#include "settings.h"
#include "size.h"
#include "types.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace typeguesser {

// Maps a typed Value to its scalar family. Null and string values have none.
inline std::optional<ScalarKind> scalar_kind_of(const Value& value) {
  // Alternatives 2.. of Value line up with ScalarKind.
  size_t index = value.index();
  if (index < 2)
    return std::nullopt;
  return static_cast<ScalarKind>(index - 2);
}

/**
 * @brief One concrete storage type: its acceptance test, size growth and
 * parser.
 *
 * Deciders are immutable after construction and hold no per-column state, so
 * one instance is shared read-only by every Guesser built on the same
 * registry. All culture-dependent behaviour comes from the GuessSettings
 * passed into each call.
 *
 * Subclasses implement accept() on whitespace-trimmed text. The public
 * is_acceptable() grows the caller's size only when accept() succeeds.
 */
class TypeDecider {
public:
  // Throws GuessException(INVALID_DECIDER_CONFIGURATION) when a typed
  // decider claims no scalar kinds. Only the TEXTUAL fallback may claim none.
  TypeDecider(TypeTag type, CompatibilityGroup group, std::initializer_list<ScalarKind> kinds);
  virtual ~TypeDecider() = default;

  TypeDecider(const TypeDecider&) = delete;
  TypeDecider& operator=(const TypeDecider&) = delete;

  TypeTag type() const { return type_; }
  CompatibilityGroup group() const { return group_; }
  const char* name() const { return type_name(type_); }

  // Acceptance and size growth in one step: size is only written when the
  // candidate is accepted.
  bool is_acceptable(std::string_view candidate, const GuessSettings& settings, Size& size) const;

  // Acceptance test without size growth.
  bool is_acceptable(std::string_view candidate, const GuessSettings& settings) const;

  // Parses text this decider accepts. Throws GuessException(PARSE_FAILURE)
  // for anything else.
  Scalar parse(std::string_view candidate, const GuessSettings& settings) const;

  // Structural check against the subsumed scalar kinds.
  bool accepts_scalar(ScalarKind kind) const { return (scalar_mask_ >> static_cast<unsigned>(kind)) & 1u; }
  bool accepts_scalar(const Value& value) const;

  // Grows size to cover a typed value this decider accepts. Never allocates.
  virtual void grow_for_scalar(const Value& value, Size& size) const;

  // Width of this type rendered as text, given the size one value needed.
  virtual uint32_t canonical_string_length(const Size& size) const;

protected:
  virtual bool accept(std::string_view trimmed, const GuessSettings& settings,
                      Size& size) const = 0;
  virtual bool try_parse(std::string_view candidate, const GuessSettings& settings,
                         Scalar& out) const = 0;

private:
  TypeTag type_;
  CompatibilityGroup group_;
  uint32_t scalar_mask_ = 0;
};

} // namespace typeguesser
