#include "drafts/rule_builder.hpp"

#include <stdexcept>
#include <utility>

#include "dsl/rule_codec.hpp"
#include "dsl/value_io.hpp"
#include "drafts/draft_validation.hpp"

namespace rule_drafts {

static std::string join_refs(const std::vector<NamedRef> &refs) {
  std::string out;
  for (const auto &ref : refs) {
    if (!out.empty()) {
      out += ", ";
    }
    out += ref.name + " (" + ref.id + ")";
  }
  return out;
}

static std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  const auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::vector<ChatMessage>
build_rule_builder_prompt(const RuleBuilderRequest &request,
                          const std::string &system_prompt) {
  std::vector<ChatMessage> messages;
  messages.push_back({"system", system_prompt});

  for (const auto &msg : request.conversation_history) {
    messages.push_back(msg);
  }

  // Context only decorates the opening turn
  if (!request.conversation_history.empty()) {
    messages.push_back({"user", request.text});
    return messages;
  }

  std::string user = request.text;
  if (request.product_context) {
    const auto &ctx = *request.product_context;
    user += "\n\nProduct Context:\n- Product Name: " + ctx.name.value_or("Unknown") +
            "\n- Line of Business: " + ctx.line_of_business.value_or("Unknown");
    if (!ctx.coverages.empty()) {
      user += "\n- Available Coverages: " + join_refs(ctx.coverages);
    }
    if (!ctx.forms.empty()) {
      user += "\n- Available Forms: " + join_refs(ctx.forms);
    }
  }
  if (request.target_id) {
    user += "\n\nTarget ID: " + *request.target_id;
  }

  messages.push_back({"user", user});
  return messages;
}

std::vector<ChatMessage>
build_refinement_prompt(const rule_dsl::RuleDraft &current,
                        const std::string &instructions,
                        const std::string &system_prompt) {
  const std::string draft_json =
      rule_dsl::to_json(rule_dsl::rule_draft_to_value(current), true);

  std::string user = "Refine this rule based on the following instructions:\n\n"
                     "Current Rule:\n" +
                     draft_json +
                     "\n\nRefinement Instructions:\n\"" + instructions +
                     "\"\n\nRespond with the updated rule as valid JSON "
                     "matching the RuleDraft schema.";

  return {{"system", system_prompt}, {"user", user}};
}

BuilderResponse extract_builder_response(const std::string &content) {
  BuilderResponse conversational;
  conversational.success = true;
  conversational.message = content;
  conversational.needs_more_info = true;

  // Span from the first '{' to the last '}', provided "logic" lies inside
  const auto open = content.find('{');
  if (open == std::string::npos) {
    return conversational;
  }
  const auto logic_key = content.find("\"logic\"", open);
  const auto close = content.rfind('}');
  if (logic_key == std::string::npos || close == std::string::npos ||
      close < logic_key) {
    return conversational;
  }

  rule_dsl::RuleDraft draft;
  try {
    draft = rule_dsl::parse_rule_draft_json(
        content.substr(open, close - open + 1));
  } catch (const std::runtime_error &) {
    return conversational;
  }

  if (!validate_rule_draft(draft).valid) {
    return conversational;
  }

  BuilderResponse out;
  out.success = true;
  out.message = trim(content.substr(0, open));
  if (out.message.empty()) {
    out.message = "I've created the rule \"" + draft.name +
                  "\". Please review and save it.";
  }
  out.confidence = kExtractedDraftConfidence;
  out.draft = std::move(draft);
  return out;
}

BuilderResponse builder_failure(const std::string &error) {
  BuilderResponse out;
  out.success = false;
  out.error = error.empty() ? "Unknown error" : error;
  return out;
}

} // namespace rule_drafts
