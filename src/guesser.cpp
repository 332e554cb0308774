#include "typeguesser/guesser.h"

#include "typeguesser/culture.h"
#include "typeguesser/debug.h"
#include "typeguesser/error.h"
#include "typeguesser/utf8.h"

#include <algorithm>
#include <string>

namespace typeguesser {

Guesser::Guesser() : Guesser(GuessSettings(), DeciderRegistry::shared()) {}

Guesser::Guesser(const GuessSettings& settings)
    : Guesser(settings, DeciderRegistry::shared()) {}

Guesser::Guesser(const GuessSettings& settings, const DeciderRegistry& registry)
    : registry_(&registry), settings_(settings) {}

Guesser::Guesser(const DatabaseTypeRequest& hint, const GuessSettings& settings,
                 const DeciderRegistry& registry)
    : registry_(&registry), settings_(settings) {
  current_ = registry.decider_for(hint.type());
  if (!current_) {
    throw GuessException(ErrorCode::UNSUPPORTED_TYPE,
                         std::string("No type decider is registered for ") +
                             type_name(hint.type()));
  }
  size_ = hint.size();
  fallback_length_ = current_->canonical_string_length(size_);
  unicode_ = hint.unicode();

  DebugTrace trace(settings_.debug);
  if (trace.verbose())
    trace.log_decision(current_->name(), "primed from hint");
}

void Guesser::adjust_to_compensate_for_value(const char* value) {
  if (!value) {
    ++null_count_;
    return;
  }
  adjust_to_compensate_for_value(std::string_view(value));
}

void Guesser::adjust_to_compensate_for_value(std::string_view value) {
  if (trim_whitespace(value).empty()) {
    ++null_count_;
    return;
  }

  if (regime_ == InputRegime::HARD_TYPED) {
    throw MixedTypingException(
        MixedTypingKind::STRING_AFTER_TYPED,
        format_mixed_typing(MixedTypingKind::STRING_AFTER_TYPED, "string", current_->type()));
  }

  // Length is measured on the raw text, surrounding whitespace included
  TextLength text = utf8_length(value);
  uint32_t length = static_cast<uint32_t>(text.code_points +
                                          text.non_ascii * settings_.extra_length_per_non_ascii);

  Size value_size = Size{}.grow_length(length);
  const TypeDecider& decider = registry_->classify(value, settings_, value_size);
  commit(decider, value_size, InputRegime::STRING, text.non_ascii > 0);
}

void Guesser::adjust_to_compensate_for_value(const Value& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    ++null_count_;
    return;
  }
  if (const auto* text = std::get_if<std::string_view>(&value)) {
    adjust_to_compensate_for_value(*text);
    return;
  }

  ScalarKind kind = *scalar_kind_of(value);
  const TypeDecider* decider = registry_->decider_for_scalar(kind);
  if (!decider)
    throw GuessException(ErrorCode::UNSUPPORTED_TYPE, format_unsupported_type(kind));

  if (regime_ == InputRegime::STRING) {
    MixedTypingKind mixed = mixed_typing_kind_for(kind);
    throw MixedTypingException(
        mixed, format_mixed_typing(mixed, scalar_kind_name(kind), current_->type()));
  }

  Size value_size;
  decider->grow_for_scalar(value, value_size);

  if (current_ && settings_.hard_typed_conflict == HardTypedConflictPolicy::FAIL) {
    bool compatible = current_ == decider ||
                      registry_->can_widen(current_->type(), decider->type()) ||
                      registry_->can_widen(decider->type(), current_->type()) ||
                      current_ == &registry_->string_decider();
    if (!compatible) {
      throw MixedTypingException(MixedTypingKind::TYPED_FAMILY_CONFLICT,
                                 format_mixed_typing(MixedTypingKind::TYPED_FAMILY_CONFLICT,
                                                     scalar_kind_name(kind), current_->type()));
    }
  }

  commit(*decider, value_size, InputRegime::HARD_TYPED, false);
}

void Guesser::commit(const TypeDecider& decider, const Size& value_size, InputRegime regime,
                     bool unicode) {
  uint32_t fallback_length =
      std::max(fallback_length_, decider.canonical_string_length(value_size));
  MergeResult merged = registry_->merge(current_, size_, decider, value_size, fallback_length);

  DebugTrace trace(settings_.debug);
  if (trace.verbose()) {
    switch (merged.outcome) {
    case MergeOutcome::ADOPTED:
      trace.log_decision(merged.decider->name(), regime == InputRegime::HARD_TYPED
                                                     ? "first typed value"
                                                     : "first non-null string");
      break;
    case MergeOutcome::WIDENED:
      trace.log_transition(current_->name(), merged.decider->name(), "widened within group");
      break;
    case MergeOutcome::FELL_BACK:
      trace.log_transition(current_->name(), merged.decider->name(),
                           "no widening path, falling back");
      break;
    case MergeOutcome::EXTENDED:
      break;
    }
    if (merged.size != size_) {
      trace.log_size(merged.decider->name(), merged.size.integer_digits,
                     merged.size.fractional_digits, merged.size.string_length);
    }
  }

  current_ = merged.decider;
  size_ = merged.size;
  regime_ = regime;
  fallback_length_ = fallback_length;
  unicode_ = unicode_ || unicode;
  ++value_count_;
}

DatabaseTypeRequest Guesser::guess() const {
  if (!current_)
    return DatabaseTypeRequest();
  return DatabaseTypeRequest(current_->type(), size_, unicode_);
}

Scalar Guesser::parse(std::string_view candidate) const {
  if (trim_whitespace(candidate).empty())
    return std::monostate{};
  const TypeDecider& decider = current_ ? *current_ : registry_->string_decider();
  return decider.parse(candidate, settings_);
}

Result<Scalar> Guesser::try_parse(std::string_view candidate) const {
  try {
    return Result<Scalar>::success(parse(candidate));
  } catch (const GuessException& e) {
    return Result<Scalar>::failure(e.what());
  }
}

void Guesser::reset() {
  current_ = nullptr;
  size_ = Size{};
  regime_ = InputRegime::UNSET;
  fallback_length_ = 0;
  unicode_ = false;
  value_count_ = 0;
  null_count_ = 0;
}

} // namespace typeguesser
