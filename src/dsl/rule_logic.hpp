#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rule_dsl {

// Tagged JSON value used for condition operands, action values and contexts.
using Value = google::protobuf::Value;
using Struct = google::protobuf::Struct;

// Comparison operators for a single condition
enum class ConditionOperator {
  Equals,
  NotEquals,
  In,
  NotIn,
  Gt,
  Gte,
  Lt,
  Lte,
  Contains,
  NotContains,
  Exists,
  NotExists,
  Between,
  StartsWith,
  EndsWith,
  Matches // regex pattern
};

// Type hint carried alongside a condition value (informational only)
enum class ConditionValueType { String, Number, Boolean, Array, Date };

enum class LogicalOperator { And, Or };

enum class ActionType {
  Set,          // Set a field value
  Add,          // Add to an array or increment
  Remove,       // Remove from array or decrement
  Block,        // Block eligibility/transaction
  Require,      // Require underwriting referral
  ApplyFactor,  // Apply pricing factor
  AttachForm,   // Attach a form to policy
  DetachForm,   // Remove a form from policy
  AddMessage,   // Add warning/info message
  SetCoverage,  // Set coverage availability
  SetLimit,     // Set coverage limit
  SetDeductible,
  Custom
};

// Operators for action value modification
enum class ActionOperator { Equals, Add, Subtract, Multiply, Divide };

enum class MessageSeverity { Info, Warning, Error, Success };

struct Condition {
  std::string field; // dotted path, e.g. "risk.classCode"
  ConditionOperator op = ConditionOperator::Equals;
  std::optional<Value> value; // absent for exists/notExists
  std::optional<ConditionValueType> value_type;
  std::string description;
};

struct ConditionNode;

// AND/OR combination of conditions and nested groups
struct ConditionGroup {
  LogicalOperator op = LogicalOperator::And;
  std::vector<ConditionNode> conditions;
};

// Exactly one of a leaf condition or a nested group
struct ConditionNode {
  std::variant<Condition, ConditionGroup> node;
};

struct Action {
  ActionType type = ActionType::Custom;
  std::string target; // e.g. "eligibility", "pricing.factor", "forms.CP0010"
  std::optional<ActionOperator> op;
  std::optional<Value> value;
  std::optional<std::string> message;
  std::optional<MessageSeverity> severity;
  std::string description;
};

struct RuleLogic {
  int version = 1;
  ConditionGroup if_group;
  std::vector<Action> then_actions;
  std::optional<std::vector<Action>> else_actions;
};

// Candidate rule produced by the AI rule builder, pending validation
struct RuleDraft {
  std::string name;
  std::string rule_type;
  std::string rule_category;
  std::optional<std::string> target_id;
  std::string status;
  bool proprietary = false;
  int priority = 0;
  std::optional<std::string> reference;
  std::string source_text;
  std::string condition_text;
  std::string outcome_text;
  RuleLogic logic;
};

// Enum <-> wire name conversion
// parse_* throws std::runtime_error on unknown names
const char *to_string(ConditionOperator op);
const char *to_string(ConditionValueType type);
const char *to_string(LogicalOperator op);
const char *to_string(ActionType type);
const char *to_string(ActionOperator op);
const char *to_string(MessageSeverity severity);

ConditionOperator parse_condition_operator(const std::string &name);
ConditionValueType parse_condition_value_type(const std::string &name);
LogicalOperator parse_logical_operator(const std::string &name);
ActionType parse_action_type(const std::string &name);
ActionOperator parse_action_operator(const std::string &name);
MessageSeverity parse_message_severity(const std::string &name);

// Whether the operator reads condition.value at all
bool operator_requires_value(ConditionOperator op);

} // namespace rule_dsl
