#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace typeguesser {

// Storage types a column can be guessed as, in preference order.
// STRING is the universal fallback and always comes last.
enum class TypeTag : uint8_t {
  BOOLEAN = 0,
  INTEGER = 1,
  DECIMAL = 2,
  DATETIME = 3,
  DURATION = 4,
  STRING = 5
};

constexpr size_t TYPE_TAG_COUNT = 6;

// Deciders in the same group may widen into one another.
enum class CompatibilityGroup : uint8_t { NUMERICAL = 0, TEMPORAL = 1, BOOLEAN = 2, TEXTUAL = 3 };

// Families of already-typed input values.
enum class ScalarKind : uint8_t {
  BOOL = 0,
  INT8 = 1,
  INT16 = 2,
  INT32 = 3,
  INT64 = 4,
  DECIMAL = 5,
  DATETIME = 6,
  DURATION = 7,
  BINARY = 8 // no decider is ever registered for raw bytes
};

constexpr size_t SCALAR_KIND_COUNT = 9;

// Fixed-point decimal: value = unscaled * 10^-scale.
struct Decimal {
  int64_t unscaled = 0;
  int32_t scale = 0;

  double to_double() const;

  bool operator==(const Decimal& other) const = default;
};

// Microseconds since 1970-01-01T00:00:00Z.
struct DateTime {
  int64_t micros_since_epoch = 0;

  bool operator==(const DateTime& other) const = default;
};

// Signed elapsed time in microseconds.
struct Duration {
  int64_t micros = 0;

  bool operator==(const Duration& other) const = default;
};

// Non-owning view over raw bytes.
struct Binary {
  std::span<const uint8_t> bytes;
};

// Input accepted by Guesser::adjust_to_compensate_for_value. Strings are held
// by view; the monostate alternative is the null value.
using Value = std::variant<std::monostate, std::string_view, bool, int8_t, int16_t, int32_t,
                           int64_t, Decimal, DateTime, Duration, Binary>;

// Output of parsing an accepted string. monostate is null.
using Scalar = std::variant<std::monostate, bool, int64_t, Decimal, DateTime, Duration, std::string>;

inline const char* type_name(TypeTag type) {
  switch (type) {
  case TypeTag::BOOLEAN:
    return "BOOLEAN";
  case TypeTag::INTEGER:
    return "INTEGER";
  case TypeTag::DECIMAL:
    return "DECIMAL";
  case TypeTag::DATETIME:
    return "DATETIME";
  case TypeTag::DURATION:
    return "DURATION";
  case TypeTag::STRING:
    return "STRING";
  default:
    return "INVALID";
  }
}

inline const char* group_name(CompatibilityGroup group) {
  switch (group) {
  case CompatibilityGroup::NUMERICAL:
    return "NUMERICAL";
  case CompatibilityGroup::TEMPORAL:
    return "TEMPORAL";
  case CompatibilityGroup::BOOLEAN:
    return "BOOLEAN";
  case CompatibilityGroup::TEXTUAL:
    return "TEXTUAL";
  default:
    return "INVALID";
  }
}

inline const char* scalar_kind_name(ScalarKind kind) {
  switch (kind) {
  case ScalarKind::BOOL:
    return "bool";
  case ScalarKind::INT8:
    return "int8";
  case ScalarKind::INT16:
    return "int16";
  case ScalarKind::INT32:
    return "int32";
  case ScalarKind::INT64:
    return "int64";
  case ScalarKind::DECIMAL:
    return "decimal";
  case ScalarKind::DATETIME:
    return "datetime";
  case ScalarKind::DURATION:
    return "duration";
  case ScalarKind::BINARY:
    return "binary";
  default:
    return "unknown";
  }
}

// Result type for operations that can fail
template <typename T> struct Result {
  T value;
  std::string error;
  bool ok = true;

  static Result success(T&& val) { return {std::move(val), "", true}; }
  static Result failure(std::string err) { return {{}, std::move(err), false}; }

  explicit operator bool() const { return ok; }
};

} // namespace typeguesser
