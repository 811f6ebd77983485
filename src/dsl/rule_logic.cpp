#include "dsl/rule_logic.hpp"

#include <stdexcept>
#include <utility>

namespace rule_dsl {

namespace {

template <typename E, std::size_t N>
const char *name_of(const std::pair<E, const char *> (&table)[N], E value) {
  for (const auto &entry : table) {
    if (entry.first == value) {
      return entry.second;
    }
  }
  return "unknown";
}

template <typename E, std::size_t N>
E value_of(const std::pair<E, const char *> (&table)[N], const std::string &name,
           const char *what) {
  for (const auto &entry : table) {
    if (name == entry.second) {
      return entry.first;
    }
  }
  std::string valid;
  for (const auto &entry : table) {
    if (!valid.empty()) {
      valid += ", ";
    }
    valid += entry.second;
  }
  throw std::runtime_error("Invalid " + std::string(what) + ": '" + name +
                           "'. Valid values: " + valid);
}

const std::pair<ConditionOperator, const char *> kConditionOperators[] = {
    {ConditionOperator::Equals, "equals"},
    {ConditionOperator::NotEquals, "notEquals"},
    {ConditionOperator::In, "in"},
    {ConditionOperator::NotIn, "notIn"},
    {ConditionOperator::Gt, "gt"},
    {ConditionOperator::Gte, "gte"},
    {ConditionOperator::Lt, "lt"},
    {ConditionOperator::Lte, "lte"},
    {ConditionOperator::Contains, "contains"},
    {ConditionOperator::NotContains, "notContains"},
    {ConditionOperator::Exists, "exists"},
    {ConditionOperator::NotExists, "notExists"},
    {ConditionOperator::Between, "between"},
    {ConditionOperator::StartsWith, "startsWith"},
    {ConditionOperator::EndsWith, "endsWith"},
    {ConditionOperator::Matches, "matches"},
};

const std::pair<ConditionValueType, const char *> kValueTypes[] = {
    {ConditionValueType::String, "string"},
    {ConditionValueType::Number, "number"},
    {ConditionValueType::Boolean, "boolean"},
    {ConditionValueType::Array, "array"},
    {ConditionValueType::Date, "date"},
};

const std::pair<LogicalOperator, const char *> kLogicalOperators[] = {
    {LogicalOperator::And, "AND"},
    {LogicalOperator::Or, "OR"},
};

const std::pair<ActionType, const char *> kActionTypes[] = {
    {ActionType::Set, "set"},
    {ActionType::Add, "add"},
    {ActionType::Remove, "remove"},
    {ActionType::Block, "block"},
    {ActionType::Require, "require"},
    {ActionType::ApplyFactor, "applyFactor"},
    {ActionType::AttachForm, "attachForm"},
    {ActionType::DetachForm, "detachForm"},
    {ActionType::AddMessage, "addMessage"},
    {ActionType::SetCoverage, "setCoverage"},
    {ActionType::SetLimit, "setLimit"},
    {ActionType::SetDeductible, "setDeductible"},
    {ActionType::Custom, "custom"},
};

const std::pair<ActionOperator, const char *> kActionOperators[] = {
    {ActionOperator::Equals, "equals"},
    {ActionOperator::Add, "add"},
    {ActionOperator::Subtract, "subtract"},
    {ActionOperator::Multiply, "multiply"},
    {ActionOperator::Divide, "divide"},
};

const std::pair<MessageSeverity, const char *> kSeverities[] = {
    {MessageSeverity::Info, "info"},
    {MessageSeverity::Warning, "warning"},
    {MessageSeverity::Error, "error"},
    {MessageSeverity::Success, "success"},
};

} // namespace

const char *to_string(ConditionOperator op) {
  return name_of(kConditionOperators, op);
}
const char *to_string(ConditionValueType type) {
  return name_of(kValueTypes, type);
}
const char *to_string(LogicalOperator op) {
  return name_of(kLogicalOperators, op);
}
const char *to_string(ActionType type) { return name_of(kActionTypes, type); }
const char *to_string(ActionOperator op) {
  return name_of(kActionOperators, op);
}
const char *to_string(MessageSeverity severity) {
  return name_of(kSeverities, severity);
}

ConditionOperator parse_condition_operator(const std::string &name) {
  return value_of(kConditionOperators, name, "condition operator");
}

ConditionValueType parse_condition_value_type(const std::string &name) {
  return value_of(kValueTypes, name, "valueType");
}

LogicalOperator parse_logical_operator(const std::string &name) {
  return value_of(kLogicalOperators, name, "group op");
}

ActionType parse_action_type(const std::string &name) {
  return value_of(kActionTypes, name, "action type");
}

ActionOperator parse_action_operator(const std::string &name) {
  return value_of(kActionOperators, name, "action operator");
}

MessageSeverity parse_message_severity(const std::string &name) {
  return value_of(kSeverities, name, "severity");
}

bool operator_requires_value(ConditionOperator op) {
  return op != ConditionOperator::Exists && op != ConditionOperator::NotExists;
}

} // namespace rule_dsl
