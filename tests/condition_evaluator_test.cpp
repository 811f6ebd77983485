#include "engine/condition_evaluator.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

using rule_engine::evaluate_condition;
using rule_engine::evaluate_group;
using rule_engine::resolve_path;
using test_support::context;
using test_support::group;

namespace {

const char *kStateAndTiv = R"({"op": "AND", "conditions": [
    {"field": "risk.state", "operator": "equals", "value": "CA"},
    {"field": "risk.tiv", "operator": "gt", "value": 1000000}]})";

TEST(ResolvePath, WalksNestedObjects) {
  auto ctx = context(R"({"coverage": {"building": {"limit": 250000}}})");
  const auto *v = resolve_path(ctx, "coverage.building.limit");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->number_value(), 250000);
}

TEST(ResolvePath, MissingSegmentsAreAbsent) {
  auto ctx = context(R"({"risk": {"state": "CA"}})");
  EXPECT_EQ(resolve_path(ctx, "risk.county"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "policy.term"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "pricing.base.rate"), nullptr);
}

TEST(ResolvePath, ScalarIntermediateIsAbsent) {
  auto ctx = context(R"({"risk": {"state": "CA"}})");
  EXPECT_EQ(resolve_path(ctx, "risk.state.code"), nullptr);
}

TEST(ResolvePath, NumericSegmentIndexesLists) {
  auto ctx = context(R"({"risk": {"locations": [
      {"state": "CA"}, {"state": "TX", "zips": ["90210", "73301"]}]}})");

  const auto *first = resolve_path(ctx, "risk.locations.0.state");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->string_value(), "CA");

  const auto *zip = resolve_path(ctx, "risk.locations.1.zips.1");
  ASSERT_NE(zip, nullptr);
  EXPECT_EQ(zip->string_value(), "73301");

  const auto *list = resolve_path(ctx, "risk.locations");
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(list->list_value().values_size(), 2);

  EXPECT_EQ(resolve_path(ctx, "risk.locations.2.state"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "risk.locations.-1.state"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "risk.locations.01.state"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "risk.locations.first.state"), nullptr);
  EXPECT_EQ(resolve_path(ctx, "risk.locations."), nullptr);
}

TEST(ConditionEvaluator, MatchesThroughListIndex) {
  auto ctx = context(R"({"risk": {"locations": [{"state": "CA"}]}})");
  auto result = evaluate_condition(
      std::get<rule_dsl::Condition>(group(R"({"op": "AND", "conditions": [
          {"field": "risk.locations.0.state", "operator": "equals", "value": "CA"}]})")
                                        .conditions[0]
                                        .node),
      ctx);
  EXPECT_TRUE(result.matched);
  ASSERT_TRUE(result.actual_value.has_value());
  EXPECT_EQ(result.actual_value->string_value(), "CA");
}

TEST(ResolvePath, ReturnsNullValuesAsPresent) {
  auto ctx = context(R"({"insured": {"dba": null}})");
  const auto *v = resolve_path(ctx, "insured.dba");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->kind_case(), rule_dsl::Value::kNullValue);
}

TEST(ConditionEvaluator, RecordsOperandsForAudit) {
  auto g = group(
      R"({"op": "AND", "conditions": [{"field": "risk.tiv", "operator": "gt", "value": 1000000}]})");
  const auto &cond = std::get<rule_dsl::Condition>(g.conditions[0].node);

  auto result = evaluate_condition(cond, context(R"({"risk": {"tiv": 2000000}})"));
  EXPECT_TRUE(result.matched);
  EXPECT_EQ(result.field_path, "risk.tiv");
  ASSERT_TRUE(result.actual_value.has_value());
  EXPECT_EQ(result.actual_value->number_value(), 2000000);
  ASSERT_TRUE(result.expected_value.has_value());
  EXPECT_EQ(result.expected_value->number_value(), 1000000);
  EXPECT_EQ(result.condition.op, rule_dsl::ConditionOperator::Gt);
}

TEST(ConditionEvaluator, AbsentFieldIsUnmatchedNotAnError) {
  auto g = group(
      R"({"op": "AND", "conditions": [{"field": "risk.tiv", "operator": "gt", "value": 1}]})");
  const auto &cond = std::get<rule_dsl::Condition>(g.conditions[0].node);

  auto result = evaluate_condition(cond, context("{}"));
  EXPECT_FALSE(result.matched);
  EXPECT_FALSE(result.actual_value.has_value());
}

TEST(ConditionGroup, AllAndConditionsMatch) {
  auto eval = evaluate_group(group(kStateAndTiv),
                             context(R"({"risk": {"state": "CA", "tiv": 2000000}})"));
  EXPECT_TRUE(eval.matched);
  EXPECT_EQ(eval.results.size(), 2u);
}

TEST(ConditionGroup, LastAndConditionFailsAfterBothEvaluated) {
  auto eval = evaluate_group(group(kStateAndTiv),
                             context(R"({"risk": {"state": "CA", "tiv": 500000}})"));
  EXPECT_FALSE(eval.matched);
  ASSERT_EQ(eval.results.size(), 2u);
  EXPECT_TRUE(eval.results[0].matched);
  EXPECT_FALSE(eval.results[1].matched);
  EXPECT_EQ(eval.results[1].field_path, "risk.tiv");
}

TEST(ConditionGroup, AndStopsAtFirstFailure) {
  auto eval = evaluate_group(group(kStateAndTiv),
                             context(R"({"risk": {"state": "NY", "tiv": 2000000}})"));
  EXPECT_FALSE(eval.matched);
  ASSERT_EQ(eval.results.size(), 1u);
  EXPECT_EQ(eval.results[0].field_path, "risk.state");
}

TEST(ConditionGroup, OrStopsAtFirstMatch) {
  auto g = group(R"({"op": "OR", "conditions": [
      {"field": "risk.state", "operator": "equals", "value": "CA"},
      {"field": "risk.state", "operator": "equals", "value": "NY"},
      {"field": "risk.state", "operator": "equals", "value": "TX"}]})");

  auto eval = evaluate_group(g, context(R"({"risk": {"state": "NY"}})"));
  EXPECT_TRUE(eval.matched);
  ASSERT_EQ(eval.results.size(), 2u);
  EXPECT_FALSE(eval.results[0].matched);
  EXPECT_TRUE(eval.results[1].matched);
}

TEST(ConditionGroup, OrWithNoMatchEvaluatesEverything) {
  auto g = group(R"({"op": "OR", "conditions": [
      {"field": "risk.state", "operator": "equals", "value": "CA"},
      {"field": "risk.state", "operator": "equals", "value": "TX"}]})");

  auto eval = evaluate_group(g, context(R"({"risk": {"state": "NY"}})"));
  EXPECT_FALSE(eval.matched);
  EXPECT_EQ(eval.results.size(), 2u);
}

TEST(ConditionGroup, EmptyAndIsVacuouslyTrue) {
  auto eval = evaluate_group(group(R"({"op": "AND", "conditions": []})"),
                             context("{}"));
  EXPECT_TRUE(eval.matched);
  EXPECT_TRUE(eval.results.empty());
}

TEST(ConditionGroup, EmptyOrIsFalse) {
  auto eval = evaluate_group(group(R"({"op": "OR", "conditions": []})"),
                             context("{}"));
  EXPECT_FALSE(eval.matched);
  EXPECT_TRUE(eval.results.empty());
}

TEST(ConditionGroup, NestedResultsFlattenInEvaluationOrder) {
  // OR[ AND[a fails, b skipped], c matches ]
  auto g = group(R"({"op": "OR", "conditions": [
      {"op": "AND", "conditions": [
          {"field": "risk.a", "operator": "equals", "value": 1},
          {"field": "risk.b", "operator": "equals", "value": 2}]},
      {"field": "risk.c", "operator": "equals", "value": 3}]})");

  auto eval = evaluate_group(g, context(R"({"risk": {"a": 0, "b": 2, "c": 3}})"));
  EXPECT_TRUE(eval.matched);
  ASSERT_EQ(eval.results.size(), 2u);
  EXPECT_EQ(eval.results[0].field_path, "risk.a");
  EXPECT_EQ(eval.results[1].field_path, "risk.c");
}

TEST(ConditionGroup, FailedNestedGroupShortCircuitsParentAnd) {
  auto g = group(R"({"op": "AND", "conditions": [
      {"op": "OR", "conditions": [
          {"field": "risk.x", "operator": "exists"}]},
      {"field": "risk.y", "operator": "exists"}]})");

  auto eval = evaluate_group(g, context(R"({"risk": {"y": 1}})"));
  EXPECT_FALSE(eval.matched);
  ASSERT_EQ(eval.results.size(), 1u);
  EXPECT_EQ(eval.results[0].field_path, "risk.x");
}

TEST(ConditionGroup, EmptyNestedGroupsFeedParent) {
  auto g = group(R"({"op": "AND", "conditions": [
      {"op": "AND", "conditions": []},
      {"op": "OR", "conditions": []}]})");
  EXPECT_FALSE(evaluate_group(g, context("{}")).matched);
}

TEST(ConditionGroup, AndMatchesIffEveryChildMatches) {
  auto g = group(R"({"op": "AND", "conditions": [
      {"field": "risk.a", "operator": "exists"},
      {"op": "OR", "conditions": [
          {"field": "risk.b", "operator": "exists"},
          {"field": "risk.c", "operator": "exists"}]}]})");

  EXPECT_TRUE(evaluate_group(g, context(R"({"risk": {"a": 1, "c": 1}})")).matched);
  EXPECT_TRUE(evaluate_group(g, context(R"({"risk": {"a": 1, "b": 1}})")).matched);
  EXPECT_FALSE(evaluate_group(g, context(R"({"risk": {"a": 1}})")).matched);
  EXPECT_FALSE(evaluate_group(g, context(R"({"risk": {"b": 1, "c": 1}})")).matched);
}

} // namespace
