#pragma once

#include <cstddef>

#include "dsl/rule_logic.hpp"

namespace rule_engine {

// Longest string `matches` will search. std::regex backtracks recursively
// per input character, so longer subjects could exhaust the stack; they
// evaluate to false instead.
constexpr std::size_t kMaxMatchInputBytes = 4096;

// Apply a condition operator to an actual and an expected value.
//
// Total: never throws. A null pointer means the value is absent (missing
// path or no condition value). Operand kinds the operator does not accept
// produce false rather than an error.
bool compare(rule_dsl::ConditionOperator op, const rule_dsl::Value *actual,
             const rule_dsl::Value *expected);

} // namespace rule_engine
