#include "engine/action_applier.hpp"

#include <optional>

#include "engine/condition_evaluator.hpp"

namespace rule_engine {

using rule_dsl::Action;
using rule_dsl::ActionOperator;
using rule_dsl::ActionType;
using rule_dsl::MessageSeverity;
using rule_dsl::Struct;
using rule_dsl::Value;

bool is_context_namespace(const std::string &name) {
  return name == "risk" || name == "policy" || name == "coverage" ||
         name == "pricing" || name == "location" || name == "insured" ||
         name == "custom";
}

ActionOutcome select_and_apply(const rule_dsl::RuleLogic &logic, bool matched) {
  ActionOutcome out;

  if (matched) {
    out.actions = logic.then_actions;
  } else if (logic.else_actions) {
    out.actions = *logic.else_actions;
  }

  for (const auto &action : out.actions) {
    switch (action.type) {
    case ActionType::AddMessage:
      if (action.message) {
        out.messages.push_back(
            {*action.message, action.severity.value_or(MessageSeverity::Info)});
      }
      break;

    case ActionType::Block:
      out.blocked = true;
      if (action.message) {
        out.messages.push_back({*action.message, MessageSeverity::Error});
      }
      break;

    default:
      // Reported through `actions` only
      break;
    }
  }

  return out;
}

// Combine the current value at the target with the action value.
// nullopt means the action contributes nothing to the delta.
static std::optional<Value> apply_operator(const Action &action,
                                           const Value *current) {
  const Value &value = *action.value;
  const ActionOperator op = action.op.value_or(ActionOperator::Equals);

  if (op == ActionOperator::Equals) {
    return value;
  }

  if (!current || current->kind_case() != Value::kNumberValue ||
      value.kind_case() != Value::kNumberValue) {
    return std::nullopt;
  }

  const double lhs = current->number_value();
  const double rhs = value.number_value();
  Value out;

  switch (op) {
  case ActionOperator::Add:
    out.set_number_value(lhs + rhs);
    break;
  case ActionOperator::Subtract:
    out.set_number_value(lhs - rhs);
    break;
  case ActionOperator::Multiply:
    out.set_number_value(lhs * rhs);
    break;
  case ActionOperator::Divide:
    if (rhs == 0.0) {
      return std::nullopt;
    }
    out.set_number_value(lhs / rhs);
    break;
  case ActionOperator::Equals:
    break;
  }
  return out;
}

// Write value at a dotted path, creating intermediate structs. A non-object
// intermediate is replaced.
static void write_path(Struct &root, const std::string &path,
                       const Value &value) {
  Struct *current = &root;
  std::string::size_type start = 0;

  while (true) {
    const auto dot = path.find('.', start);
    if (dot == std::string::npos) {
      (*current->mutable_fields())[path.substr(start)] = value;
      return;
    }
    Value &next = (*current->mutable_fields())[path.substr(start, dot - start)];
    current = next.mutable_struct_value();
    start = dot + 1;
  }
}

Struct compute_context_delta(const std::vector<Action> &actions,
                             const Struct &context) {
  Struct delta;

  for (const auto &action : actions) {
    if (action.type != ActionType::Set || !action.value) {
      continue;
    }

    const auto dot = action.target.find('.');
    if (dot == std::string::npos || dot + 1 == action.target.size() ||
        !is_context_namespace(action.target.substr(0, dot))) {
      continue;
    }

    // Earlier set actions in the same branch take precedence over the context
    const Value *current = resolve_path(delta, action.target);
    if (!current) {
      current = resolve_path(context, action.target);
    }

    if (auto next = apply_operator(action, current)) {
      write_path(delta, action.target, *next);
    }
  }

  return delta;
}

} // namespace rule_engine
