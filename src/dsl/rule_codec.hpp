#pragma once

#include <string>

#include "dsl/rule_logic.hpp"

namespace rule_dsl {

// Deepest condition-group nesting accepted by the decoder; the `if` group is
// level 1. Keeps every accepted rule within what the protobuf JSON utilities
// can parse and print.
constexpr int kMaxGroupDepth = 8;

// Decode the JSON-shaped value of a RuleLogic document.
// Throws std::runtime_error naming the offending location
// (e.g. "[RULE LOGIC] if.conditions[1]: missing required field 'operator'").
RuleLogic decode_rule_logic(const Value &value);

// Parse RuleLogic from its JSON wire format.
// Throws std::runtime_error on malformed JSON or an invalid structure.
RuleLogic parse_rule_logic_json(const std::string &json);

// Encode RuleLogic to the same shape decode_rule_logic reads.
Value rule_logic_to_value(const RuleLogic &logic);
std::string rule_logic_to_json(const RuleLogic &logic);

Value condition_to_value(const Condition &condition);
Value action_to_value(const Action &action);

// RuleDraft: metadata fields are optional at decode time, logic is required.
RuleDraft decode_rule_draft(const Value &value);
RuleDraft parse_rule_draft_json(const std::string &json);
Value rule_draft_to_value(const RuleDraft &draft);
std::string rule_draft_to_json(const RuleDraft &draft);

} // namespace rule_dsl
