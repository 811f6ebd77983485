#include "engine/value_comparator.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <regex>
#include <string>

#include "dsl/value_io.hpp"

namespace rule_engine {

using rule_dsl::ConditionOperator;
using rule_dsl::Value;

namespace {

bool is_number(const Value *v) {
  return v && v->kind_case() == Value::kNumberValue;
}

bool is_string(const Value *v) {
  return v && v->kind_case() == Value::kStringValue;
}

bool is_list(const Value *v) {
  return v && v->kind_case() == Value::kListValue;
}

bool is_present(const Value *v) {
  return v && v->kind_case() != Value::kNullValue &&
         v->kind_case() != Value::KIND_NOT_SET;
}

// Absent only equals absent; otherwise strict structural equality.
bool strictly_equal(const Value *a, const Value *b) {
  if (!a || !b) {
    return !a && !b;
  }
  return rule_dsl::values_equal(*a, *b);
}

bool list_includes(const Value &list, const Value *needle) {
  if (!needle) {
    return false;
  }
  for (const auto &item : list.list_value().values()) {
    if (rule_dsl::values_equal(item, *needle)) {
      return true;
    }
  }
  return false;
}

// Numeric bound for between: numbers as-is, numeric strings converted
std::optional<double> to_bound(const Value &v) {
  if (v.kind_case() == Value::kNumberValue) {
    return v.number_value();
  }
  if (v.kind_case() != Value::kStringValue || v.string_value().empty()) {
    return std::nullopt;
  }
  const std::string &s = v.string_value();
  const char *begin = s.c_str();
  char *end = nullptr;
  errno = 0;
  double d = std::strtod(begin, &end);
  if (errno != 0 || end == begin) {
    return std::nullopt;
  }
  while (*end == ' ' || *end == '\t') {
    ++end;
  }
  if (*end != '\0') {
    return std::nullopt;
  }
  return d;
}

// contains/notContains share a guard: false for both when it fails
std::optional<bool> contains(const Value *actual, const Value *expected) {
  if (is_string(actual) && is_string(expected)) {
    return actual->string_value().find(expected->string_value()) !=
           std::string::npos;
  }
  if (is_list(actual)) {
    return list_includes(*actual, expected);
  }
  return std::nullopt;
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool regex_search(const std::string &text, const std::string &pattern) {
  if (text.size() > kMaxMatchInputBytes ||
      pattern.size() > kMaxMatchInputBytes) {
    return false;
  }
  try {
    std::regex re(pattern, std::regex::ECMAScript);
    return std::regex_search(text, re);
  } catch (const std::regex_error &) {
    // Invalid pattern (or regex engine complexity limit)
    return false;
  }
}

} // namespace

bool compare(ConditionOperator op, const Value *actual, const Value *expected) {
  switch (op) {
  case ConditionOperator::Equals:
    return strictly_equal(actual, expected);
  case ConditionOperator::NotEquals:
    return !strictly_equal(actual, expected);

  case ConditionOperator::In:
    return is_list(expected) && list_includes(*expected, actual);
  case ConditionOperator::NotIn:
    return is_list(expected) && !list_includes(*expected, actual);

  case ConditionOperator::Gt:
    return is_number(actual) && is_number(expected) &&
           actual->number_value() > expected->number_value();
  case ConditionOperator::Gte:
    return is_number(actual) && is_number(expected) &&
           actual->number_value() >= expected->number_value();
  case ConditionOperator::Lt:
    return is_number(actual) && is_number(expected) &&
           actual->number_value() < expected->number_value();
  case ConditionOperator::Lte:
    return is_number(actual) && is_number(expected) &&
           actual->number_value() <= expected->number_value();

  case ConditionOperator::Contains: {
    auto hit = contains(actual, expected);
    return hit && *hit;
  }
  case ConditionOperator::NotContains: {
    auto hit = contains(actual, expected);
    return hit && !*hit;
  }

  case ConditionOperator::Exists:
    return is_present(actual);
  case ConditionOperator::NotExists:
    return !is_present(actual);

  case ConditionOperator::Between: {
    if (!is_number(actual) || !is_list(expected) ||
        expected->list_value().values_size() != 2) {
      return false;
    }
    auto low = to_bound(expected->list_value().values(0));
    auto high = to_bound(expected->list_value().values(1));
    if (!low || !high) {
      return false;
    }
    double n = actual->number_value();
    return n >= *low && n <= *high;
  }

  case ConditionOperator::StartsWith:
    return is_string(actual) && is_string(expected) &&
           starts_with(actual->string_value(), expected->string_value());
  case ConditionOperator::EndsWith:
    return is_string(actual) && is_string(expected) &&
           ends_with(actual->string_value(), expected->string_value());

  case ConditionOperator::Matches:
    return is_string(actual) && is_string(expected) &&
           regex_search(actual->string_value(), expected->string_value());
  }

  return false;
}

} // namespace rule_engine
