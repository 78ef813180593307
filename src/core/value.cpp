#include "core/value.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace hub_rules {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool is_numeric(const Value &v) {
  return std::holds_alternative<int64_t>(v) || std::holds_alternative<double>(v);
}

double as_double(const Value &v) {
  if (std::holds_alternative<int64_t>(v)) {
    return static_cast<double>(std::get<int64_t>(v));
  }
  return std::get<double>(v);
}

// -1, 0, 1 for ordered pairs; nullopt when the pair has no ordering
std::optional<int> order(const Value &lhs, const Value &rhs) {
  if (!has_value(lhs) || !has_value(rhs)) {
    return std::nullopt;
  }
  if (is_numeric(lhs) && is_numeric(rhs)) {
    if (std::holds_alternative<int64_t>(lhs) &&
        std::holds_alternative<int64_t>(rhs)) {
      const int64_t a = std::get<int64_t>(lhs);
      const int64_t b = std::get<int64_t>(rhs);
      return a < b ? -1 : (a > b ? 1 : 0);
    }
    const double a = as_double(lhs);
    const double b = as_double(rhs);
    return a < b ? -1 : (a > b ? 1 : 0);
  }
  if (lhs.index() != rhs.index()) {
    return std::nullopt;
  }
  if (std::holds_alternative<bool>(lhs)) {
    const int a = std::get<bool>(lhs) ? 1 : 0;
    const int b = std::get<bool>(rhs) ? 1 : 0;
    return a - b;
  }
  const int c = std::get<std::string>(lhs).compare(std::get<std::string>(rhs));
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::string to_string(const Value &v) {
  if (std::holds_alternative<std::monostate>(v)) {
    return "<none>";
  }
  if (std::holds_alternative<bool>(v)) {
    return std::get<bool>(v) ? "true" : "false";
  }
  if (std::holds_alternative<int64_t>(v)) {
    return std::to_string(std::get<int64_t>(v));
  }
  if (std::holds_alternative<double>(v)) {
    std::ostringstream os;
    os << std::get<double>(v);
    return os.str();
  }
  return std::get<std::string>(v);
}

std::string to_string(CompareOp op) {
  switch (op) {
  case CompareOp::Equal:
    return "==";
  case CompareOp::NotEqual:
    return "!=";
  case CompareOp::Greater:
    return ">";
  case CompareOp::GreaterEqual:
    return ">=";
  case CompareOp::Less:
    return "<";
  case CompareOp::LessEqual:
    return "<=";
  }
  return "?";
}

CompareOp parse_compare_op(const std::string &text) {
  if (text == "==" || text == "=")
    return CompareOp::Equal;
  if (text == "!=")
    return CompareOp::NotEqual;
  if (text == ">")
    return CompareOp::Greater;
  if (text == ">=")
    return CompareOp::GreaterEqual;
  if (text == "<")
    return CompareOp::Less;
  if (text == "<=")
    return CompareOp::LessEqual;
  throw std::invalid_argument("Unknown comparator: '" + text + "'");
}

Value parse_scalar(const std::string &text) {
  static const std::regex int_pattern(R"(^[-+]?\d+$)");
  static const std::regex double_pattern(
      R"(^[-+]?(\d+\.\d*|\.\d+|\d+)([eE][-+]?\d+)?$)");

  const std::string lower = lowercase(text);
  if (lower == "true") {
    return true;
  }
  if (lower == "false") {
    return false;
  }
  if (std::regex_match(text, int_pattern)) {
    try {
      return static_cast<int64_t>(std::stoll(text));
    } catch (const std::out_of_range &) {
      return std::stod(text);
    }
  }
  if (std::regex_match(text, double_pattern)) {
    return std::stod(text);
  }
  return text;
}

Value coerce_like(const Value &reading, const Value &operand) {
  if (!has_value(reading) || !has_value(operand)) {
    return reading;
  }

  if (std::holds_alternative<bool>(operand)) {
    if (std::holds_alternative<std::string>(reading)) {
      const std::string s = lowercase(std::get<std::string>(reading));
      return s == "true" || s == "1" || s == "yes" || s == "on" ||
             s == "active" || s == "open";
    }
    if (is_numeric(reading)) {
      return as_double(reading) != 0.0;
    }
    return reading;
  }

  if (is_numeric(operand) && std::holds_alternative<std::string>(reading)) {
    const Value parsed = parse_scalar(std::get<std::string>(reading));
    return is_numeric(parsed) ? parsed : reading;
  }

  if (std::holds_alternative<std::string>(operand) &&
      !std::holds_alternative<std::string>(reading)) {
    return to_string(reading);
  }

  return reading;
}

bool compare_values(const Value &lhs, CompareOp op, const Value &rhs) {
  const std::optional<int> c = order(lhs, rhs);
  switch (op) {
  case CompareOp::Equal:
    if (!has_value(lhs) && !has_value(rhs)) {
      return true;
    }
    return c.has_value() && *c == 0;
  case CompareOp::NotEqual:
    if (!has_value(lhs) && !has_value(rhs)) {
      return false;
    }
    return !c.has_value() || *c != 0;
  case CompareOp::Greater:
    return c.has_value() && *c > 0;
  case CompareOp::GreaterEqual:
    return c.has_value() && *c >= 0;
  case CompareOp::Less:
    return c.has_value() && *c < 0;
  case CompareOp::LessEqual:
    return c.has_value() && *c <= 0;
  }
  return false;
}

} // namespace hub_rules
