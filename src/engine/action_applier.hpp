#pragma once

#include <string>
#include <vector>

#include "dsl/rule_logic.hpp"

namespace rule_engine {

struct RuleMessage {
  std::string message;
  rule_dsl::MessageSeverity severity = rule_dsl::MessageSeverity::Info;
};

struct ActionOutcome {
  std::vector<rule_dsl::Action> actions; // selected branch, declaration order
  std::vector<RuleMessage> messages;
  bool blocked = false;
  rule_dsl::Struct context_delta;
};

// Select the then/else branch and interpret message and block actions.
// Every other action type is only reported; callers apply those against their
// own model. context_delta is left empty here (see compute_context_delta).
ActionOutcome select_and_apply(const rule_dsl::RuleLogic &logic, bool matched);

// Values that `set` actions rooted in a context namespace (risk, policy,
// coverage, pricing, location, insured, custom) would write, as a nested
// struct shaped like the context. The context itself is not modified.
rule_dsl::Struct compute_context_delta(const std::vector<rule_dsl::Action> &actions,
                                       const rule_dsl::Struct &context);

bool is_context_namespace(const std::string &name);

} // namespace rule_engine
