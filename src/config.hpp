#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "dsl/rule_logic.hpp"
#include "engine/rule_set.hpp"

namespace rulekit_provider {

// Worker bounds for evaluation.workers
constexpr std::size_t kMinWorkers = 1;
constexpr std::size_t kMaxWorkers = 64;

constexpr const char *kDefaultBuilderSystemPrompt =
    "You are an insurance rules analyst. Turn the user's plain-English rule "
    "into a RuleDraft JSON object with fields name, ruleType, ruleCategory, "
    "targetId, status, proprietary, priority, reference, sourceText, "
    "conditionText, outcomeText and logic. If the rule is ambiguous, ask one "
    "clarifying question instead of answering with JSON.";

// Rule specification
struct RuleSpec {
  std::string id;
  std::string name;
  int priority = 0; // 0..100
  bool enabled = true;
  std::optional<std::string> logic_file; // as written in the config
  rule_dsl::RuleLogic logic;
};

// Complete provider configuration
struct ProviderConfig {
  std::string config_file_path; // Path to config file (for relative resolution)
  std::optional<std::string> provider_name;
  std::size_t workers = 1;
  std::string builder_system_prompt = kDefaultBuilderSystemPrompt;
  std::vector<RuleSpec> rules;
};

// Load provider configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
ProviderConfig load_config(const std::string &path);

// Load one rule logic document (.json via the JSON codec, anything else as
// YAML). Throws std::runtime_error on read or decode failure.
rule_dsl::RuleLogic load_rule_logic_file(const std::string &path);

// Build the evaluation rule set from loaded configuration
rule_engine::RuleSet build_rule_set(const ProviderConfig &config);

} // namespace rulekit_provider
