#include "engine/rule_evaluator.hpp"

#include <utility>

namespace rule_engine {

EvaluationResult evaluate(const rule_dsl::RuleLogic &logic,
                          const rule_dsl::Struct &context) {
  GroupEvaluation conditions = evaluate_group(logic.if_group, context);
  ActionOutcome outcome = select_and_apply(logic, conditions.matched);

  EvaluationResult result;
  result.matched = conditions.matched;
  result.condition_results = std::move(conditions.results);
  result.context_delta = compute_context_delta(outcome.actions, context);
  result.applicable_actions = std::move(outcome.actions);
  result.messages = std::move(outcome.messages);
  result.blocked = outcome.blocked;
  return result;
}

} // namespace rule_engine
