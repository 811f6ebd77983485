#pragma once

#include <cstddef>
#include <string>

#include "engine/rule_set.hpp"
#include "rulekit.pb.h"

namespace handlers {

constexpr const char *kProtocolVersion = "v1";
constexpr const char *kProviderVersion = "0.1.0";

// Everything a request handler may read. Built once at startup and not
// modified while the request loop runs.
struct ProviderState {
  std::string provider_name = "rulekit-provider";
  std::size_t workers = 1;
  std::string builder_system_prompt;
  rule_engine::RuleSet rules;
};

void handle_hello(const ProviderState &state,
                  const rulekit::v1::HelloRequest &req,
                  rulekit::v1::Response &resp);

void handle_list_rules(const ProviderState &state,
                       const rulekit::v1::ListRulesRequest &req,
                       rulekit::v1::Response &resp);

void handle_evaluate(const ProviderState &state,
                     const rulekit::v1::EvaluateRequest &req,
                     rulekit::v1::Response &resp);

void handle_evaluate_all(const ProviderState &state,
                         const rulekit::v1::EvaluateAllRequest &req,
                         rulekit::v1::Response &resp);

void handle_validate_draft(const rulekit::v1::ValidateDraftRequest &req,
                           rulekit::v1::Response &resp);

void handle_extract_draft(const rulekit::v1::ExtractDraftRequest &req,
                          rulekit::v1::Response &resp);

void handle_build_prompt(const ProviderState &state,
                         const rulekit::v1::BuildPromptRequest &req,
                         rulekit::v1::Response &resp);

void handle_refine_prompt(const ProviderState &state,
                          const rulekit::v1::RefinePromptRequest &req,
                          rulekit::v1::Response &resp);

void handle_get_health(const ProviderState &state,
                       const rulekit::v1::GetHealthRequest &req,
                       rulekit::v1::Response &resp);

void handle_unimplemented(rulekit::v1::Response &resp);

// Dispatch one decoded request. Always leaves a status on resp.
void dispatch(const ProviderState &state, const rulekit::v1::Request &req,
              rulekit::v1::Response &resp);

} // namespace handlers
