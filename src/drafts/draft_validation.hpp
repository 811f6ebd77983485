#pragma once

#include <string>

#include "dsl/rule_logic.hpp"

namespace rule_drafts {

struct DraftValidation {
  bool valid = false;
  std::string error; // empty when valid
};

// Pre-persistence gate for a rule draft. Checks in order: rule name present,
// at least one IF condition, at least one THEN action. Reports the first
// failure only.
DraftValidation validate_rule_draft(const rule_dsl::RuleDraft &draft);

} // namespace rule_drafts
