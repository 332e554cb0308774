#ifndef TYPEGUESSER_ERROR_H
#define TYPEGUESSER_ERROR_H

#include "types.h"

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @file error.h
 * @brief Error codes and exceptions raised by the type guessing engine.
 *
 * Every failure is synchronous and leaves the object that raised it exactly
 * as it was before the failing call. Only the error code (and, for mixed
 * typing, the sub-kind) is contractual; message text is diagnostic.
 */

namespace typeguesser {

/**
 * @brief Kinds of failure the engine can report.
 */
enum class ErrorCode {
  NONE = 0,                     ///< No error
  UNSUPPORTED_TYPE,             ///< No decider is registered for a scalar kind
  MIXED_TYPING,                 ///< Strings and typed values mixed on one guesser
  INCOMPATIBLE_TYPES,           ///< Two types cannot be combined under a strict policy
  PARSE_FAILURE,                ///< Text handed to parse() is not acceptable for the type
  INVALID_DECIDER_CONFIGURATION ///< A decider or registry is malformed
};

/**
 * @brief Which input family broke the regime lock.
 *
 * The *_AFTER_STRING kinds are raised when a typed value arrives on a guesser
 * that has already accepted strings. STRING_AFTER_TYPED is the reverse, and
 * TYPED_FAMILY_CONFLICT covers two typed families that cannot be merged.
 */
enum class MixedTypingKind {
  INT_AFTER_STRING,
  DECIMAL_AFTER_STRING,
  BOOL_AFTER_STRING,
  GENERIC_AFTER_STRING,
  STRING_AFTER_TYPED,
  TYPED_FAMILY_CONFLICT
};

/**
 * @brief Base exception for all engine failures.
 *
 * @example
 * @code
 * try {
 *     guesser.adjust_to_compensate_for_value("12");
 * } catch (const typeguesser::GuessException& e) {
 *     std::cerr << error_code_to_string(e.code()) << ": " << e.what() << std::endl;
 * }
 * @endcode
 */
class GuessException : public std::runtime_error {
public:
  GuessException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

/**
 * @brief Raised when a guesser is fed both strings and typed values, or two
 * typed families that cannot be merged.
 */
class MixedTypingException : public GuessException {
public:
  MixedTypingException(MixedTypingKind kind, const std::string& message)
      : GuessException(ErrorCode::MIXED_TYPING, message), kind_(kind) {}

  MixedTypingKind kind() const { return kind_; }

private:
  MixedTypingKind kind_;
};

const char* error_code_to_string(ErrorCode code);

const char* mixed_typing_kind_to_string(MixedTypingKind kind);

// Message builders shared by the throwing sites.
std::string format_unsupported_type(ScalarKind kind);
std::string format_mixed_typing(MixedTypingKind kind, const char* incoming, TypeTag locked);
std::string format_incompatible_types(TypeTag first, TypeTag second);
std::string format_parse_failure(std::string_view value, TypeTag type);
std::string format_invalid_decider(std::string_view reason);

// Picks the specialised kind for a typed value arriving after strings.
MixedTypingKind mixed_typing_kind_for(ScalarKind incoming);

} // namespace typeguesser

#endif // TYPEGUESSER_ERROR_H
