#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hub_rules {

// Opaque typed scalar carried by device attributes, command arguments and
// condition operands. monostate means "no value fetched yet".
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

using ValueList = std::vector<Value>;

enum class CompareOp { Equal, NotEqual, Greater, GreaterEqual, Less, LessEqual };

inline bool has_value(const Value &v) {
  return !std::holds_alternative<std::monostate>(v);
}

// Human-readable rendering used in identifiers and log lines
std::string to_string(const Value &v);

std::string to_string(CompareOp op);

// Parse "==", "=", "!=", ">", ">=", "<", "<="
// Throws std::invalid_argument on anything else
CompareOp parse_compare_op(const std::string &text);

// Type a textual scalar: true/false -> bool, integer literal -> int64,
// decimal literal -> double, anything else -> string
Value parse_scalar(const std::string &text);

// Cast a device-reported value to the kind of the operand it is compared
// against. Returns the input unchanged when no sensible cast exists.
Value coerce_like(const Value &reading, const Value &operand);

// Evaluate `lhs op rhs`. Int64 and double compare numerically; other mixed
// kinds are unequal and unordered. Ordering with an empty side is false.
bool compare_values(const Value &lhs, CompareOp op, const Value &rhs);

} // namespace hub_rules
