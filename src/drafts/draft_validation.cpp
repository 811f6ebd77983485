#include "drafts/draft_validation.hpp"

namespace rule_drafts {

DraftValidation validate_rule_draft(const rule_dsl::RuleDraft &draft) {
  if (draft.name.empty()) {
    return {false, "Rule name is required"};
  }
  if (draft.logic.if_group.conditions.empty()) {
    return {false, "Rule must have at least one condition"};
  }
  if (draft.logic.then_actions.empty()) {
    return {false, "Rule must have at least one action"};
  }
  return {true, ""};
}

} // namespace rule_drafts
