#include "drafts/rule_builder.hpp"

#include <gtest/gtest.h>

#include <string>

#include "drafts/draft_validation.hpp"
#include "dsl/rule_codec.hpp"

using namespace rule_drafts;

namespace {

constexpr const char *kDraftJson = R"({
  "name": "High TIV referral", "ruleType": "underwriting",
  "ruleCategory": "referral", "status": "draft", "priority": 50,
  "logic": {
    "if": {"op": "AND", "conditions": [
        {"field": "risk.tiv", "operator": "gt", "value": 1000000}]},
    "then": [{"type": "require", "target": "underwriterReview"}]}})";

rule_dsl::RuleDraft sample_draft() {
  return rule_dsl::parse_rule_draft_json(kDraftJson);
}

TEST(DraftValidation, AcceptsCompleteDraft) {
  auto v = validate_rule_draft(sample_draft());
  EXPECT_TRUE(v.valid);
  EXPECT_TRUE(v.error.empty());
}

TEST(DraftValidation, ReportsFirstFailure) {
  auto draft = sample_draft();
  draft.name.clear();
  draft.logic.then_actions.clear();
  EXPECT_EQ(validate_rule_draft(draft).error, "Rule name is required");

  draft = sample_draft();
  draft.logic.if_group.conditions.clear();
  EXPECT_EQ(validate_rule_draft(draft).error,
            "Rule must have at least one condition");

  draft = sample_draft();
  draft.logic.then_actions.clear();
  auto v = validate_rule_draft(draft);
  EXPECT_FALSE(v.valid);
  EXPECT_EQ(v.error, "Rule must have at least one action");
}

TEST(ExtractBuilderResponse, DraftWithLeadingText) {
  auto r = extract_builder_response(
      std::string("Here is the rule you asked for:\n\n") + kDraftJson +
      "\n");
  EXPECT_TRUE(r.success);
  EXPECT_FALSE(r.needs_more_info);
  ASSERT_TRUE(r.draft.has_value());
  EXPECT_EQ(r.draft->name, "High TIV referral");
  EXPECT_EQ(r.message, "Here is the rule you asked for:");
  EXPECT_EQ(r.confidence.value_or(0), kExtractedDraftConfidence);
}

TEST(ExtractBuilderResponse, BareDraftGetsDefaultMessage) {
  auto r = extract_builder_response(kDraftJson);
  ASSERT_TRUE(r.draft.has_value());
  EXPECT_EQ(r.message,
            "I've created the rule \"High TIV referral\". Please review and save it.");
}

TEST(ExtractBuilderResponse, QuestionIsConversational) {
  const std::string text = "Which states should this rule apply to?";
  auto r = extract_builder_response(text);
  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.needs_more_info);
  EXPECT_FALSE(r.draft.has_value());
  EXPECT_EQ(r.message, text);
  EXPECT_FALSE(r.confidence.has_value());
}

TEST(ExtractBuilderResponse, BrokenOrInvalidJsonIsConversational) {
  auto broken = extract_builder_response(R"(Try this: {"name": "x", "logic": {)");
  EXPECT_TRUE(broken.needs_more_info);
  EXPECT_FALSE(broken.draft.has_value());

  auto no_logic_key = extract_builder_response(R"({"name": "x"})");
  EXPECT_TRUE(no_logic_key.needs_more_info);

  // Decodes, but has no actions
  auto invalid = extract_builder_response(R"({"name": "x", "logic": {
      "if": {"op": "AND", "conditions": [
          {"field": "risk.state", "operator": "equals", "value": "CA"}]},
      "then": []}})");
  EXPECT_TRUE(invalid.needs_more_info);
  EXPECT_FALSE(invalid.draft.has_value());

  auto bad_operator = extract_builder_response(R"({"name": "x", "logic": {
      "if": {"op": "AND", "conditions": [
          {"field": "risk.state", "operator": "resembles", "value": "CA"}]},
      "then": [{"type": "block", "target": "e"}]}})");
  EXPECT_TRUE(bad_operator.needs_more_info);
}

TEST(BuilderFailure, CarriesError) {
  auto r = builder_failure("model timed out");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.value_or(""), "model timed out");
  EXPECT_FALSE(r.draft.has_value());

  EXPECT_EQ(builder_failure("").error.value_or(""), "Unknown error");
}

TEST(RuleBuilderPrompt, FirstTurnCarriesProductContext) {
  RuleBuilderRequest req;
  req.text = "Decline frame construction in CA";
  req.product_id = "cp-001";
  req.target_id = "cov-bldg";
  ProductContext ctx;
  ctx.name = "Commercial Property";
  ctx.coverages = {{"cov-bldg", "Building"}, {"cov-bpp", "Business Personal Property"}};
  req.product_context = ctx;

  auto msgs = build_rule_builder_prompt(req, "SYSTEM");
  ASSERT_EQ(msgs.size(), 2u);
  EXPECT_EQ(msgs[0].role, "system");
  EXPECT_EQ(msgs[0].content, "SYSTEM");
  EXPECT_EQ(msgs[1].role, "user");
  EXPECT_EQ(msgs[1].content,
            "Decline frame construction in CA"
            "\n\nProduct Context:\n- Product Name: Commercial Property"
            "\n- Line of Business: Unknown"
            "\n- Available Coverages: Building (cov-bldg), "
            "Business Personal Property (cov-bpp)"
            "\n\nTarget ID: cov-bldg");
}

TEST(RuleBuilderPrompt, LaterTurnsAppendHistoryOnly) {
  RuleBuilderRequest req;
  req.text = "Only for CA";
  req.target_id = "cov-bldg";
  req.product_context = ProductContext{};
  req.conversation_history = {{"user", "Decline frame construction"},
                              {"assistant", "Which states?"}};

  auto msgs = build_rule_builder_prompt(req, "SYSTEM");
  ASSERT_EQ(msgs.size(), 4u);
  EXPECT_EQ(msgs[1].content, "Decline frame construction");
  EXPECT_EQ(msgs[2].role, "assistant");
  EXPECT_EQ(msgs[3].content, "Only for CA");
}

TEST(RuleBuilderPrompt, RefinementEmbedsDraft) {
  auto msgs = build_refinement_prompt(sample_draft(), "raise the threshold",
                                      "SYSTEM");
  ASSERT_EQ(msgs.size(), 2u);
  EXPECT_EQ(msgs[0].content, "SYSTEM");
  const auto &user = msgs[1].content;
  EXPECT_NE(user.find("High TIV referral"), std::string::npos);
  EXPECT_NE(user.find("\"raise the threshold\""), std::string::npos);
  EXPECT_NE(user.find("risk.tiv"), std::string::npos);
}

} // namespace
