#pragma once

#include "decider.h"

#include <array>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace typeguesser {

// How a merge changed the running estimate.
enum class MergeOutcome : uint8_t {
  ADOPTED = 0,  ///< No prior estimate; the incoming decider was taken as is
  EXTENDED = 1, ///< Same decider; only the size grew
  WIDENED = 2,  ///< Same group; the later decider in preference order won
  FELL_BACK = 3 ///< No widening path; the estimate is now the String decider
};

inline const char* merge_outcome_name(MergeOutcome outcome) {
  switch (outcome) {
  case MergeOutcome::ADOPTED:
    return "ADOPTED";
  case MergeOutcome::EXTENDED:
    return "EXTENDED";
  case MergeOutcome::WIDENED:
    return "WIDENED";
  case MergeOutcome::FELL_BACK:
    return "FELL_BACK";
  default:
    return "UNKNOWN";
  }
}

struct MergeResult {
  const TypeDecider* decider = nullptr;
  Size size;
  MergeOutcome outcome = MergeOutcome::ADOPTED;
};

/**
 * @brief The ordered, immutable set of deciders and the widening lattice
 * between them.
 *
 * Deciders are stored in preference order, most specific first, and the
 * universal String decider must be present. A widening edge (from, to) lets
 * a column holding `from` values grow into `to`; both ends must share a
 * compatibility group and `from` must precede `to`.
 *
 * A registry is read-only after construction, so any number of Guessers on
 * any number of threads may share one.
 */
class DeciderRegistry {
public:
  using Widening = std::pair<TypeTag, TypeTag>;

  // Throws GuessException(INVALID_DECIDER_CONFIGURATION) when the deciders
  // or widening edges break the rules above.
  DeciderRegistry(std::vector<std::unique_ptr<TypeDecider>> deciders,
                  std::vector<Widening> widenings);

  DeciderRegistry(const DeciderRegistry&) = delete;
  DeciderRegistry& operator=(const DeciderRegistry&) = delete;

  // The built-in registry: Boolean, Integer, Decimal, DateTime, Duration,
  // String, with Integer widening into Decimal.
  static const DeciderRegistry& shared();

  // Builds the deciders and edges of the built-in registry.
  static std::vector<std::unique_ptr<TypeDecider>> default_deciders();
  static std::vector<Widening> default_widenings();

  // First decider in preference order that accepts the text, growing size.
  // Never null: the String decider accepts everything.
  const TypeDecider& classify(std::string_view candidate, const GuessSettings& settings,
                              Size& size) const;

  // Direct lookup by scalar family; null when nothing is registered.
  const TypeDecider* decider_for_scalar(ScalarKind kind) const {
    return by_scalar_[static_cast<size_t>(kind)];
  }

  // Null when the type has no decider in this registry.
  const TypeDecider* decider_for(TypeTag type) const {
    return by_type_[static_cast<size_t>(type)];
  }

  const TypeDecider& string_decider() const { return *by_type_[static_cast<size_t>(TypeTag::STRING)]; }

  // Combines the running estimate with a newly classified value. `current`
  // may be null. On fall back, string_length is raised to `fallback_length`,
  // the widest canonical rendering of any value seen so far.
  MergeResult merge(const TypeDecider* current, const Size& current_size,
                    const TypeDecider& incoming, const Size& incoming_size,
                    uint32_t fallback_length) const;

  // True when a column of `from` values may widen into `to`.
  bool can_widen(TypeTag from, TypeTag to) const;

  // Position in preference order; lower is more specific.
  size_t rank(const TypeDecider& decider) const { return rank_[static_cast<size_t>(decider.type())]; }

  const std::vector<std::unique_ptr<TypeDecider>>& deciders() const { return deciders_; }

private:
  std::vector<std::unique_ptr<TypeDecider>> deciders_;
  std::array<const TypeDecider*, TYPE_TAG_COUNT> by_type_{};
  std::array<const TypeDecider*, SCALAR_KIND_COUNT> by_scalar_{};
  std::array<size_t, TYPE_TAG_COUNT> rank_{};
  // widen_[from][to]
  std::array<std::array<bool, TYPE_TAG_COUNT>, TYPE_TAG_COUNT> widen_{};
};

} // namespace typeguesser
