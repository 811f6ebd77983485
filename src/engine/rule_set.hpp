#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "dsl/rule_logic.hpp"
#include "engine/rule_evaluator.hpp"

namespace rule_engine {

struct ConfiguredRule {
  std::string id;
  std::string name;
  int priority = 0; // higher evaluates (and reports) first
  bool enabled = true;
  rule_dsl::RuleLogic logic;
};

struct RuleOutcome {
  std::string rule_id;
  int priority = 0;
  EvaluationResult result;
};

struct RuleSetOutcome {
  std::vector<RuleOutcome> outcomes; // priority order
  bool blocked = false;              // any rule blocked
  std::vector<RuleMessage> messages; // concatenated in priority order
  std::vector<std::string> matched_rule_ids;
};

/**
 * @brief Ordered collection of configured rules.
 *
 * Rules are independent of one another, so evaluate_all() may fan the work
 * out across worker threads. Each worker evaluates against the same read-only
 * context and writes only its own result slot.
 *
 * Thread Safety:
 *   add() must not run concurrently with any other member. Const members are
 *   safe to call concurrently.
 */
class RuleSet {
public:
  RuleSet() = default;

  /**
   * @brief Add a rule.
   * @throws std::runtime_error if a rule with the same id already exists
   */
  void add(ConfiguredRule rule);

  const ConfiguredRule *find(const std::string &id) const;

  // All rules in insertion order, enabled or not
  const std::vector<ConfiguredRule> &rules() const { return rules_; }

  std::size_t size() const { return rules_.size(); }

  /**
   * @brief Enabled rules by descending priority.
   *
   * Rules with equal priority keep their insertion order.
   */
  std::vector<const ConfiguredRule *> ordered() const;

  /**
   * @brief Evaluate every enabled rule against one context.
   *
   * @param context Read-only evaluation context
   * @param workers Worker thread count; values <= 1 evaluate inline
   * @return Per-rule results plus the blocked/messages roll-up
   */
  RuleSetOutcome evaluate_all(const rule_dsl::Struct &context,
                              std::size_t workers = 1) const;

private:
  std::vector<ConfiguredRule> rules_;
};

} // namespace rule_engine
