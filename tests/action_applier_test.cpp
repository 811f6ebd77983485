#include "engine/action_applier.hpp"

#include <gtest/gtest.h>

#include "engine/condition_evaluator.hpp"
#include "test_support.hpp"

using rule_dsl::ActionType;
using rule_dsl::MessageSeverity;
using rule_engine::compute_context_delta;
using rule_engine::resolve_path;
using rule_engine::select_and_apply;
using test_support::context;
using test_support::logic;

namespace {

const char *kAnyGroup = R"({"op": "AND", "conditions": []})";

TEST(ActionApplier, BlockForcesErrorSeverity) {
  auto l = logic(kAnyGroup,
                 R"([{"type": "block", "target": "eligibility", "message": "Declined", "severity": "info"}])");
  auto out = select_and_apply(l, true);

  EXPECT_TRUE(out.blocked);
  ASSERT_EQ(out.messages.size(), 1u);
  EXPECT_EQ(out.messages[0].message, "Declined");
  EXPECT_EQ(out.messages[0].severity, MessageSeverity::Error);
  ASSERT_EQ(out.actions.size(), 1u);
  EXPECT_EQ(out.actions[0].type, ActionType::Block);
}

TEST(ActionApplier, BlockWithoutMessageStillBlocks) {
  auto l = logic(kAnyGroup, R"([{"type": "block", "target": "eligibility"}])");
  auto out = select_and_apply(l, true);
  EXPECT_TRUE(out.blocked);
  EXPECT_TRUE(out.messages.empty());
}

TEST(ActionApplier, AddMessageDefaultsToInfo) {
  auto l = logic(kAnyGroup, R"([
      {"type": "addMessage", "target": "messages", "message": "Check roof age"},
      {"type": "addMessage", "target": "messages", "message": "Flood zone", "severity": "warning"}])");
  auto out = select_and_apply(l, true);

  EXPECT_FALSE(out.blocked);
  ASSERT_EQ(out.messages.size(), 2u);
  EXPECT_EQ(out.messages[0].severity, MessageSeverity::Info);
  EXPECT_EQ(out.messages[1].message, "Flood zone");
  EXPECT_EQ(out.messages[1].severity, MessageSeverity::Warning);
}

TEST(ActionApplier, AddMessageWithoutTextAddsNoMessage) {
  auto l = logic(kAnyGroup, R"([{"type": "addMessage", "target": "messages"}])");
  auto out = select_and_apply(l, true);
  EXPECT_TRUE(out.messages.empty());
  EXPECT_EQ(out.actions.size(), 1u);
}

TEST(ActionApplier, OtherActionsAreReportedInDeclarationOrder) {
  auto l = logic(kAnyGroup, R"([
      {"type": "attachForm", "target": "forms.CP0010"},
      {"type": "applyFactor", "target": "pricing.factor", "operator": "multiply", "value": 1.1},
      {"type": "require", "target": "underwriting.referral", "value": true},
      {"type": "setLimit", "target": "coverage.building.limit", "value": 500000}])");
  auto out = select_and_apply(l, true);

  EXPECT_FALSE(out.blocked);
  EXPECT_TRUE(out.messages.empty());
  ASSERT_EQ(out.actions.size(), 4u);
  EXPECT_EQ(out.actions[0].type, ActionType::AttachForm);
  EXPECT_EQ(out.actions[1].type, ActionType::ApplyFactor);
  EXPECT_EQ(out.actions[2].type, ActionType::Require);
  EXPECT_EQ(out.actions[3].type, ActionType::SetLimit);
}

TEST(ActionApplier, UnmatchedWithoutElseSelectsNothing) {
  auto l = logic(kAnyGroup, R"([{"type": "block", "target": "eligibility"}])");
  auto out = select_and_apply(l, false);
  EXPECT_TRUE(out.actions.empty());
  EXPECT_FALSE(out.blocked);
  EXPECT_TRUE(out.messages.empty());
}

TEST(ActionApplier, UnmatchedSelectsElseBranch) {
  auto l = logic(kAnyGroup,
                 R"([{"type": "addMessage", "target": "m", "message": "then"}])",
                 R"([{"type": "block", "target": "eligibility", "message": "else"}])");
  auto out = select_and_apply(l, false);

  EXPECT_TRUE(out.blocked);
  ASSERT_EQ(out.messages.size(), 1u);
  EXPECT_EQ(out.messages[0].message, "else");
}

TEST(ActionApplier, BlockAnywhereInBranchBlocks) {
  auto l = logic(kAnyGroup, R"([
      {"type": "addMessage", "target": "m", "message": "first"},
      {"type": "block", "target": "eligibility", "message": "second"},
      {"type": "addMessage", "target": "m", "message": "third", "severity": "success"}])");
  auto out = select_and_apply(l, true);

  EXPECT_TRUE(out.blocked);
  ASSERT_EQ(out.messages.size(), 3u);
  EXPECT_EQ(out.messages[0].message, "first");
  EXPECT_EQ(out.messages[1].severity, MessageSeverity::Error);
  EXPECT_EQ(out.messages[2].severity, MessageSeverity::Success);
}

TEST(ContextDelta, SetRecordsTargetValue) {
  auto l = logic(kAnyGroup, R"([{"type": "set", "target": "pricing.factor", "value": 1.2}])");
  auto delta = compute_context_delta(l.then_actions, context("{}"));

  const auto *v = resolve_path(delta, "pricing.factor");
  ASSERT_NE(v, nullptr);
  EXPECT_DOUBLE_EQ(v->number_value(), 1.2);
}

TEST(ContextDelta, ArithmeticUsesCurrentContextValue) {
  auto l = logic(kAnyGroup, R"([
      {"type": "set", "target": "pricing.factor", "operator": "multiply", "value": 1.5},
      {"type": "set", "target": "pricing.factor", "operator": "add", "value": 0.5},
      {"type": "set", "target": "coverage.limit", "operator": "subtract", "value": 1000}])");
  auto ctx = context(R"({"pricing": {"factor": 2}, "coverage": {"limit": 5000}})");
  auto delta = compute_context_delta(l.then_actions, ctx);

  // (2 * 1.5) + 0.5; the second action sees the first one's result
  EXPECT_DOUBLE_EQ(resolve_path(delta, "pricing.factor")->number_value(), 3.5);
  EXPECT_DOUBLE_EQ(resolve_path(delta, "coverage.limit")->number_value(), 4000);

  // Context is left untouched
  EXPECT_DOUBLE_EQ(resolve_path(ctx, "pricing.factor")->number_value(), 2);
}

TEST(ContextDelta, SkipsUnusableActions) {
  auto l = logic(kAnyGroup, R"([
      {"type": "set", "target": "pricing.factor", "operator": "divide", "value": 0},
      {"type": "set", "target": "pricing.missing", "operator": "add", "value": 1},
      {"type": "set", "target": "eligibility", "value": false},
      {"type": "set", "target": "pricing.noValue"},
      {"type": "applyFactor", "target": "pricing.other", "value": 2}])");
  auto delta = compute_context_delta(l.then_actions,
                                     context(R"({"pricing": {"factor": 2}})"));
  EXPECT_EQ(delta.fields_size(), 0);
}

} // namespace
