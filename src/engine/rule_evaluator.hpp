#pragma once

#include <vector>

#include "dsl/rule_logic.hpp"
#include "engine/action_applier.hpp"
#include "engine/condition_evaluator.hpp"

namespace rule_engine {

struct EvaluationResult {
  bool matched = false;
  std::vector<ConditionEvaluationResult> condition_results;
  std::vector<rule_dsl::Action> applicable_actions;
  std::vector<RuleMessage> messages;
  bool blocked = false;
  rule_dsl::Struct context_delta;
};

// Evaluate one rule against a context: condition tree, then branch actions.
// Stateless and safe to call concurrently on a shared logic/context; neither
// argument is modified.
EvaluationResult evaluate(const rule_dsl::RuleLogic &logic,
                          const rule_dsl::Struct &context);

} // namespace rule_engine
