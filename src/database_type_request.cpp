#include "typeguesser/database_type_request.h"

#include "typeguesser/error.h"
#include "typeguesser/registry.h"

#include <algorithm>
#include <sstream>

namespace typeguesser {

std::string DatabaseTypeRequest::to_string() const {
  std::ostringstream ss;
  ss << type_name(type_);
  if (type_ == TypeTag::DECIMAL)
    ss << "(" << size_.precision() << "," << size_.scale() << ")";
  else if (type_ == TypeTag::INTEGER)
    ss << "(" << size_.integer_digits << ")";
  ss << " width=" << size_.string_length;
  if (unicode_)
    ss << " unicode";
  return ss.str();
}

DatabaseTypeRequest DatabaseTypeRequest::max(const DatabaseTypeRequest& first,
                                             const DatabaseTypeRequest& second,
                                             TypeConflictPolicy policy) {
  return max(first, second, policy, DeciderRegistry::shared());
}

DatabaseTypeRequest DatabaseTypeRequest::max(const DatabaseTypeRequest& first,
                                             const DatabaseTypeRequest& second,
                                             TypeConflictPolicy policy,
                                             const DeciderRegistry& registry) {
  const TypeDecider* a = registry.decider_for(first.type_);
  const TypeDecider* b = registry.decider_for(second.type_);
  if (!a || !b) {
    std::string message = std::string("No type decider is registered for ") +
                          type_name(a ? second.type_ : first.type_);
    throw GuessException(ErrorCode::UNSUPPORTED_TYPE, message);
  }

  uint32_t fallback_length =
      std::max(a->canonical_string_length(first.size_), b->canonical_string_length(second.size_));
  MergeResult merged = registry.merge(a, first.size_, *b, second.size_, fallback_length);

  // Combining with an existing STRING is never a conflict
  bool conflict = merged.outcome == MergeOutcome::FELL_BACK && first.type_ != TypeTag::STRING &&
                  second.type_ != TypeTag::STRING;
  if (conflict && policy == TypeConflictPolicy::STRICT) {
    throw GuessException(ErrorCode::INCOMPATIBLE_TYPES,
                         format_incompatible_types(first.type_, second.type_));
  }

  return DatabaseTypeRequest(merged.decider->type(), merged.size,
                             first.unicode_ || second.unicode_);
}

} // namespace typeguesser
