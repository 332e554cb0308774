#include "typeguesser/error.h"

#include <sstream>

namespace typeguesser {

const char* error_code_to_string(ErrorCode code) {
  // LCOV_EXCL_BR_START - exhaustive switch; all codes tested elsewhere
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::UNSUPPORTED_TYPE:
    return "UNSUPPORTED_TYPE";
  case ErrorCode::MIXED_TYPING:
    return "MIXED_TYPING";
  case ErrorCode::INCOMPATIBLE_TYPES:
    return "INCOMPATIBLE_TYPES";
  case ErrorCode::PARSE_FAILURE:
    return "PARSE_FAILURE";
  case ErrorCode::INVALID_DECIDER_CONFIGURATION:
    return "INVALID_DECIDER_CONFIGURATION";
  default:
    return "UNKNOWN";
  }
  // LCOV_EXCL_BR_STOP
}

const char* mixed_typing_kind_to_string(MixedTypingKind kind) {
  switch (kind) {
  case MixedTypingKind::INT_AFTER_STRING:
    return "INT_AFTER_STRING";
  case MixedTypingKind::DECIMAL_AFTER_STRING:
    return "DECIMAL_AFTER_STRING";
  case MixedTypingKind::BOOL_AFTER_STRING:
    return "BOOL_AFTER_STRING";
  case MixedTypingKind::GENERIC_AFTER_STRING:
    return "GENERIC_AFTER_STRING";
  case MixedTypingKind::STRING_AFTER_TYPED:
    return "STRING_AFTER_TYPED";
  case MixedTypingKind::TYPED_FAMILY_CONFLICT:
    return "TYPED_FAMILY_CONFLICT";
  default:
    return "UNKNOWN";
  }
}

MixedTypingKind mixed_typing_kind_for(ScalarKind incoming) {
  switch (incoming) {
  case ScalarKind::INT8:
  case ScalarKind::INT16:
  case ScalarKind::INT32:
  case ScalarKind::INT64:
    return MixedTypingKind::INT_AFTER_STRING;
  case ScalarKind::DECIMAL:
    return MixedTypingKind::DECIMAL_AFTER_STRING;
  case ScalarKind::BOOL:
    return MixedTypingKind::BOOL_AFTER_STRING;
  default:
    return MixedTypingKind::GENERIC_AFTER_STRING;
  }
}

std::string format_unsupported_type(ScalarKind kind) {
  std::ostringstream ss;
  ss << "No type decider is registered for values of kind '" << scalar_kind_name(kind) << "'";
  return ss.str();
}

std::string format_mixed_typing(MixedTypingKind kind, const char* incoming, TypeTag locked) {
  std::ostringstream ss;
  switch (kind) {
  case MixedTypingKind::INT_AFTER_STRING:
    ss << "Cannot accept " << incoming
       << " value: the guesser has already seen string values. Integers and strings cannot be "
          "mixed on one guesser; reset it first";
    break;
  case MixedTypingKind::DECIMAL_AFTER_STRING:
    ss << "Cannot accept decimal value: the guesser has already seen string values. Decimals "
          "and strings cannot be mixed on one guesser; reset it first";
    break;
  case MixedTypingKind::BOOL_AFTER_STRING:
    ss << "Cannot accept bool value: the guesser has already seen string values. Booleans and "
          "strings cannot be mixed on one guesser; reset it first";
    break;
  case MixedTypingKind::GENERIC_AFTER_STRING:
    ss << "Cannot accept " << incoming << " value: the guesser has already seen string values";
    break;
  case MixedTypingKind::STRING_AFTER_TYPED:
    ss << "Cannot accept string value: the guesser is locked to typed " << type_name(locked)
       << " values";
    break;
  case MixedTypingKind::TYPED_FAMILY_CONFLICT:
    ss << "Cannot accept " << incoming << " value: the guesser is locked to "
       << type_name(locked) << " and the two cannot be combined";
    break;
  }
  return ss.str();
}

std::string format_incompatible_types(TypeTag first, TypeTag second) {
  std::ostringstream ss;
  ss << "Types " << type_name(first) << " and " << type_name(second)
     << " are not compatible and cannot be combined";
  return ss.str();
}

std::string format_parse_failure(std::string_view value, TypeTag type) {
  std::ostringstream ss;
  ss << "Could not parse '" << value << "' as " << type_name(type);
  return ss.str();
}

std::string format_invalid_decider(std::string_view reason) {
  std::ostringstream ss;
  ss << "Invalid type decider configuration: " << reason;
  return ss.str();
}

} // namespace typeguesser
