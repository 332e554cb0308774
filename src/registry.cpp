#include "typeguesser/registry.h"

#include "typeguesser/deciders.h"
#include "typeguesser/error.h"

#include <string>

namespace typeguesser {

[[noreturn]] static void invalid(const std::string& reason) {
  throw GuessException(ErrorCode::INVALID_DECIDER_CONFIGURATION, format_invalid_decider(reason));
}

DeciderRegistry::DeciderRegistry(std::vector<std::unique_ptr<TypeDecider>> deciders,
                                 std::vector<Widening> widenings)
    : deciders_(std::move(deciders)) {
  if (deciders_.empty())
    invalid("registry has no deciders");

  for (size_t i = 0; i < deciders_.size(); ++i) {
    const TypeDecider* decider = deciders_[i].get();
    if (!decider)
      invalid("registry contains a null decider");

    size_t t = static_cast<size_t>(decider->type());
    if (by_type_[t])
      invalid(std::string("two deciders registered for ") + type_name(decider->type()));
    by_type_[t] = decider;
    rank_[t] = i;

    for (size_t k = 0; k < SCALAR_KIND_COUNT; ++k) {
      if (!decider->accepts_scalar(static_cast<ScalarKind>(k)))
        continue;
      if (by_scalar_[k])
        invalid(std::string("scalar kind ") + scalar_kind_name(static_cast<ScalarKind>(k)) +
                " claimed by both " + by_scalar_[k]->name() + " and " + decider->name());
      by_scalar_[k] = decider;
    }
  }

  const TypeDecider* fallback = by_type_[static_cast<size_t>(TypeTag::STRING)];
  if (!fallback || fallback != deciders_.back().get())
    invalid("the String decider must be registered last");

  for (const auto& [from, to] : widenings) {
    const TypeDecider* a = decider_for(from);
    const TypeDecider* b = decider_for(to);
    if (!a || !b)
      invalid(std::string("widening ") + type_name(from) + " -> " + type_name(to) +
              " names an unregistered type");
    if (a->group() != b->group())
      invalid(std::string("widening ") + type_name(from) + " -> " + type_name(to) +
              " crosses compatibility groups");
    if (rank(*a) >= rank(*b))
      invalid(std::string("widening ") + type_name(from) + " -> " + type_name(to) +
              " runs against preference order");
    widen_[static_cast<size_t>(from)][static_cast<size_t>(to)] = true;
  }
}

const DeciderRegistry& DeciderRegistry::shared() {
  static const DeciderRegistry registry(default_deciders(), default_widenings());
  return registry;
}

std::vector<std::unique_ptr<TypeDecider>> DeciderRegistry::default_deciders() {
  std::vector<std::unique_ptr<TypeDecider>> deciders;
  deciders.push_back(std::make_unique<BooleanDecider>());
  deciders.push_back(std::make_unique<IntegerDecider>());
  deciders.push_back(std::make_unique<DecimalDecider>());
  deciders.push_back(std::make_unique<DateTimeDecider>());
  deciders.push_back(std::make_unique<DurationDecider>());
  deciders.push_back(std::make_unique<StringDecider>());
  return deciders;
}

std::vector<DeciderRegistry::Widening> DeciderRegistry::default_widenings() {
  return {{TypeTag::INTEGER, TypeTag::DECIMAL}};
}

const TypeDecider& DeciderRegistry::classify(std::string_view candidate,
                                             const GuessSettings& settings, Size& size) const {
  for (const auto& decider : deciders_) {
    if (decider->is_acceptable(candidate, settings, size))
      return *decider;
  }
  return string_decider();
}

bool DeciderRegistry::can_widen(TypeTag from, TypeTag to) const {
  return widen_[static_cast<size_t>(from)][static_cast<size_t>(to)];
}

MergeResult DeciderRegistry::merge(const TypeDecider* current, const Size& current_size,
                                   const TypeDecider& incoming, const Size& incoming_size,
                                   uint32_t fallback_length) const {
  MergeResult result;
  result.size = current_size.combine(incoming_size);

  if (!current) {
    result.decider = &incoming;
    result.outcome = MergeOutcome::ADOPTED;
  } else if (current == &incoming) {
    result.decider = current;
    result.outcome = MergeOutcome::EXTENDED;
  } else if (can_widen(current->type(), incoming.type())) {
    result.decider = &incoming;
    result.outcome = MergeOutcome::WIDENED;
  } else if (can_widen(incoming.type(), current->type())) {
    // Already the wider of the two
    result.decider = current;
    result.outcome = MergeOutcome::EXTENDED;
  } else {
    result.decider = &string_decider();
    result.outcome = current == result.decider ? MergeOutcome::EXTENDED : MergeOutcome::FELL_BACK;
  }

  if (result.decider == &string_decider())
    result.size = result.size.grow_length(fallback_length);
  return result;
}

} // namespace typeguesser
