#include "engine/condition_evaluator.hpp"

#include "engine/value_comparator.hpp"

namespace rule_engine {

using rule_dsl::Condition;
using rule_dsl::ConditionGroup;
using rule_dsl::LogicalOperator;
using rule_dsl::Struct;
using rule_dsl::Value;

// Parse a list index segment: base-10 digits only, no sign or padding
static bool parse_index(const std::string &segment, int size, int &index) {
  if (segment.empty() || segment.size() > 9 ||
      (segment.size() > 1 && segment[0] == '0')) {
    return false;
  }
  int n = 0;
  for (char c : segment) {
    if (c < '0' || c > '9') {
      return false;
    }
    n = n * 10 + (c - '0');
  }
  if (n >= size) {
    return false;
  }
  index = n;
  return true;
}

// One step down from an object or list; nullptr when the step is not possible
static const Value *step(const Value &from, const std::string &segment) {
  if (from.kind_case() == Value::kStructValue) {
    const auto &fields = from.struct_value().fields();
    auto it = fields.find(segment);
    return it == fields.end() ? nullptr : &it->second;
  }
  if (from.kind_case() == Value::kListValue) {
    const auto &list = from.list_value();
    int index = 0;
    if (!parse_index(segment, list.values_size(), index)) {
      return nullptr;
    }
    return &list.values(index);
  }
  return nullptr;
}

const Value *resolve_path(const Struct &context, const std::string &path) {
  const auto first_dot = path.find('.');
  auto it = context.fields().find(path.substr(0, first_dot));
  if (it == context.fields().end()) {
    return nullptr;
  }
  const Value *current = &it->second;

  auto start = first_dot;
  while (current && start != std::string::npos) {
    ++start;
    const auto dot = path.find('.', start);
    current = step(*current, path.substr(start, dot == std::string::npos
                                                    ? std::string::npos
                                                    : dot - start));
    start = dot;
  }
  return current;
}

ConditionEvaluationResult evaluate_condition(const Condition &condition,
                                             const Struct &context) {
  const Value *actual = resolve_path(context, condition.field);
  const Value *expected = condition.value ? &*condition.value : nullptr;

  ConditionEvaluationResult result;
  result.condition = condition;
  result.matched = compare(condition.op, actual, expected);
  if (actual) {
    result.actual_value = *actual;
  }
  result.expected_value = condition.value;
  result.field_path = condition.field;
  return result;
}

static bool evaluate_group_into(const ConditionGroup &group,
                                const Struct &context,
                                std::vector<ConditionEvaluationResult> &trace) {
  const bool is_and = group.op == LogicalOperator::And;

  for (const auto &child : group.conditions) {
    bool child_matched = false;

    if (const auto *cond = std::get_if<Condition>(&child.node)) {
      trace.push_back(evaluate_condition(*cond, context));
      child_matched = trace.back().matched;
    } else {
      child_matched = evaluate_group_into(std::get<ConditionGroup>(child.node),
                                          context, trace);
    }

    if (is_and && !child_matched) {
      return false;
    }
    if (!is_and && child_matched) {
      return true;
    }
  }

  // Loop ran to completion: every AND child matched, no OR child did
  return is_and;
}

GroupEvaluation evaluate_group(const ConditionGroup &group,
                               const Struct &context) {
  GroupEvaluation out;
  out.matched = evaluate_group_into(group, context, out.results);
  return out;
}

} // namespace rule_engine
