#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dsl/rule_logic.hpp"

namespace rule_engine {

// Trace entry for one evaluated leaf condition
struct ConditionEvaluationResult {
  rule_dsl::Condition condition;
  bool matched = false;
  std::optional<rule_dsl::Value> actual_value;   // nullopt = path absent
  std::optional<rule_dsl::Value> expected_value; // nullopt = no condition value
  std::string field_path;
};

struct GroupEvaluation {
  bool matched = false;
  // Leaf results in evaluation order; short-circuited siblings are absent
  std::vector<ConditionEvaluationResult> results;
};

// Walk a dotted path ("risk.building.yearBuilt") through nested structs.
// A numeric segment indexes into a list ("risk.locations.0.state").
// Returns nullptr when any segment is missing, an index is out of range, or an
// intermediate value is a scalar. Never throws.
const rule_dsl::Value *resolve_path(const rule_dsl::Struct &context,
                                    const std::string &path);

ConditionEvaluationResult evaluate_condition(const rule_dsl::Condition &condition,
                                             const rule_dsl::Struct &context);

// Recursive AND/OR evaluation with short-circuiting.
// An empty AND group matches; an empty OR group does not.
GroupEvaluation evaluate_group(const rule_dsl::ConditionGroup &group,
                               const rule_dsl::Struct &context);

} // namespace rule_engine
