#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dsl/rule_logic.hpp"

namespace rule_drafts {

// Confidence reported for a draft extracted from a conversational response
constexpr int kExtractedDraftConfidence = 85;

struct ChatMessage {
  std::string role; // "system", "user" or "assistant"
  std::string content;
};

struct NamedRef {
  std::string id;
  std::string name;
};

struct ProductContext {
  std::optional<std::string> name;
  std::optional<std::string> line_of_business;
  std::vector<NamedRef> coverages;
  std::vector<NamedRef> forms;
};

struct RuleBuilderRequest {
  std::string text;
  std::string product_id;
  std::optional<std::string> target_id;
  std::optional<ProductContext> product_context;
  std::vector<ChatMessage> conversation_history;
};

struct BuilderResponse {
  bool success = false;
  std::optional<rule_dsl::RuleDraft> draft;
  std::string message;
  std::optional<std::string> error;
  std::optional<int> confidence;
  bool needs_more_info = false;
};

// Chat messages to send to the rule-builder model: system prompt, prior
// turns, then the user text. On the first turn the user text is followed by
// the product context and target id when given.
std::vector<ChatMessage>
build_rule_builder_prompt(const RuleBuilderRequest &request,
                          const std::string &system_prompt);

// Messages asking the model to rework an existing draft.
std::vector<ChatMessage>
build_refinement_prompt(const rule_dsl::RuleDraft &current,
                        const std::string &instructions,
                        const std::string &system_prompt);

// Interpret a model reply. A JSON object containing "logic" that decodes to a
// valid draft yields that draft; anything else (no JSON, bad JSON, a draft
// that fails validation) is treated as a clarifying question.
// Never throws for any input text.
BuilderResponse extract_builder_response(const std::string &content);

// Response reported when the generation call itself failed
BuilderResponse builder_failure(const std::string &error);

} // namespace rule_drafts
