#include "core/handlers.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "config.hpp"
#include "core/health.hpp"
#include "core/transport/framed_stdio.hpp"
#include "drafts/draft_validation.hpp"
#include "drafts/rule_builder.hpp"
#include "dsl/rule_codec.hpp"
#include "engine/rule_evaluator.hpp"

namespace handlers {

using rulekit::v1::Response;
using rulekit::v1::Status;

namespace {

inline void set_status_ok(Response &resp) {
  resp.mutable_status()->set_code(Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

inline void set_status(Response &resp, Status::Code code,
                       const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

rulekit::v1::Severity to_proto(rule_dsl::MessageSeverity severity) {
  switch (severity) {
  case rule_dsl::MessageSeverity::Info:
    return rulekit::v1::SEVERITY_INFO;
  case rule_dsl::MessageSeverity::Warning:
    return rulekit::v1::SEVERITY_WARNING;
  case rule_dsl::MessageSeverity::Error:
    return rulekit::v1::SEVERITY_ERROR;
  case rule_dsl::MessageSeverity::Success:
    return rulekit::v1::SEVERITY_SUCCESS;
  }
  return rulekit::v1::SEVERITY_UNSPECIFIED;
}

void copy_messages(
    const std::vector<rule_engine::RuleMessage> &messages,
    google::protobuf::RepeatedPtrField<rulekit::v1::RuleMessage> *out) {
  for (const auto &m : messages) {
    auto *pm = out->Add();
    pm->set_message(m.message);
    pm->set_severity(to_proto(m.severity));
  }
}

void to_proto(const rule_engine::EvaluationResult &result,
              rulekit::v1::EvaluationResult *out) {
  out->set_matched(result.matched);
  out->set_blocked(result.blocked);

  for (const auto &cr : result.condition_results) {
    auto *pc = out->add_condition_results();
    pc->set_field_path(cr.field_path);
    pc->set_condition_operator(rule_dsl::to_string(cr.condition.op));
    pc->set_matched(cr.matched);
    if (cr.actual_value) {
      *pc->mutable_actual_value() = *cr.actual_value;
    }
    if (cr.expected_value) {
      *pc->mutable_expected_value() = *cr.expected_value;
    }
    *pc->mutable_condition() = rule_dsl::condition_to_value(cr.condition);
  }

  for (const auto &action : result.applicable_actions) {
    *out->add_applicable_actions() = rule_dsl::action_to_value(action);
  }

  copy_messages(result.messages, out->mutable_messages());
  *out->mutable_context_delta() = result.context_delta;
}

std::vector<rule_drafts::NamedRef>
to_refs(const google::protobuf::RepeatedPtrField<rulekit::v1::NamedRef> &in) {
  std::vector<rule_drafts::NamedRef> out;
  out.reserve(static_cast<std::size_t>(in.size()));
  for (const auto &r : in) {
    out.push_back({r.id(), r.name()});
  }
  return out;
}

void set_prompt(const std::vector<rule_drafts::ChatMessage> &messages,
                Response &resp) {
  auto *out = resp.mutable_prompt();
  for (const auto &m : messages) {
    auto *pm = out->add_messages();
    pm->set_role(m.role);
    pm->set_content(m.content);
  }
}

} // namespace

void handle_hello(const ProviderState &state,
                  const rulekit::v1::HelloRequest &req, Response &resp) {
  if (req.protocol_version() != kProtocolVersion) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  auto *hello = resp.mutable_hello();
  hello->set_protocol_version(kProtocolVersion);
  hello->set_provider_name(state.provider_name);
  hello->set_provider_version(kProviderVersion);

  (*hello->mutable_metadata())["transport"] = "stdio+uint32_le";
  (*hello->mutable_metadata())["max_frame_bytes"] =
      std::to_string(transport::kMaxFrameBytes);
  (*hello->mutable_metadata())["rule_count"] =
      std::to_string(state.rules.size());

  set_status_ok(resp);
}

void handle_list_rules(const ProviderState &state,
                       const rulekit::v1::ListRulesRequest & /*req*/,
                       Response &resp) {
  auto *out = resp.mutable_list_rules();
  for (const auto &rule : state.rules.rules()) {
    auto *info = out->add_rules();
    info->set_rule_id(rule.id);
    info->set_name(rule.name);
    info->set_priority(rule.priority);
    info->set_enabled(rule.enabled);
    info->set_logic_version(rule.logic.version);
  }
  set_status_ok(resp);
}

void handle_evaluate(const ProviderState &state,
                     const rulekit::v1::EvaluateRequest &req, Response &resp) {
  rule_dsl::RuleLogic inline_logic;
  const rule_dsl::RuleLogic *logic = nullptr;

  switch (req.logic_source_case()) {
  case rulekit::v1::EvaluateRequest::kRuleId: {
    const auto *rule = state.rules.find(req.rule_id());
    if (!rule) {
      set_status(resp, Status::CODE_NOT_FOUND,
                 "unknown rule_id: " + req.rule_id());
      return;
    }
    if (!rule->enabled) {
      set_status(resp, Status::CODE_FAILED_PRECONDITION,
                 "rule is disabled: " + req.rule_id());
      return;
    }
    logic = &rule->logic;
    break;
  }
  case rulekit::v1::EvaluateRequest::kLogicJson:
    try {
      inline_logic = rule_dsl::parse_rule_logic_json(req.logic_json());
    } catch (const std::runtime_error &e) {
      set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
      return;
    }
    logic = &inline_logic;
    break;
  case rulekit::v1::EvaluateRequest::LOGIC_SOURCE_NOT_SET:
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "rule_id or logic_json is required");
    return;
  }

  const auto result = rule_engine::evaluate(*logic, req.context());
  to_proto(result, resp.mutable_evaluate()->mutable_result());
  set_status_ok(resp);
}

void handle_evaluate_all(const ProviderState &state,
                         const rulekit::v1::EvaluateAllRequest &req,
                         Response &resp) {
  std::size_t workers = state.workers;
  if (req.workers() > 0) {
    workers = std::min<std::size_t>(req.workers(),
                                    rulekit_provider::kMaxWorkers);
  }

  const auto outcome = state.rules.evaluate_all(req.context(), workers);

  auto *out = resp.mutable_evaluate_all();
  for (const auto &rule_outcome : outcome.outcomes) {
    auto *pe = out->add_results();
    pe->set_rule_id(rule_outcome.rule_id);
    pe->set_priority(rule_outcome.priority);
    to_proto(rule_outcome.result, pe->mutable_result());
  }
  out->set_blocked(outcome.blocked);
  copy_messages(outcome.messages, out->mutable_messages());
  for (const auto &id : outcome.matched_rule_ids) {
    out->add_matched_rule_ids(id);
  }

  set_status_ok(resp);
}

void handle_validate_draft(const rulekit::v1::ValidateDraftRequest &req,
                           Response &resp) {
  rule_dsl::RuleDraft draft;
  try {
    draft = rule_dsl::parse_rule_draft_json(req.draft_json());
  } catch (const std::runtime_error &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
    return;
  }

  const auto validation = rule_drafts::validate_rule_draft(draft);
  auto *out = resp.mutable_validate_draft();
  out->set_valid(validation.valid);
  out->set_error(validation.error);
  set_status_ok(resp);
}

void handle_extract_draft(const rulekit::v1::ExtractDraftRequest &req,
                          Response &resp) {
  const auto extracted =
      req.generation_error().empty()
          ? rule_drafts::extract_builder_response(req.content())
          : rule_drafts::builder_failure(req.generation_error());

  auto *out = resp.mutable_extract_draft();
  out->set_success(extracted.success);
  out->set_message(extracted.message);
  out->set_error(extracted.error.value_or(""));
  out->set_needs_more_info(extracted.needs_more_info);
  out->set_confidence(extracted.confidence.value_or(0));
  if (extracted.draft) {
    out->set_draft_json(rule_dsl::rule_draft_to_json(*extracted.draft));
  }
  set_status_ok(resp);
}

void handle_build_prompt(const ProviderState &state,
                         const rulekit::v1::BuildPromptRequest &req,
                         Response &resp) {
  if (req.text().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "text is required");
    return;
  }

  rule_drafts::RuleBuilderRequest request;
  request.text = req.text();
  request.product_id = req.product_id();
  if (req.has_target_id()) {
    request.target_id = req.target_id();
  }
  if (req.has_product_context()) {
    const auto &pc = req.product_context();
    rule_drafts::ProductContext ctx;
    if (pc.has_name()) {
      ctx.name = pc.name();
    }
    if (pc.has_line_of_business()) {
      ctx.line_of_business = pc.line_of_business();
    }
    ctx.coverages = to_refs(pc.coverages());
    ctx.forms = to_refs(pc.forms());
    request.product_context = std::move(ctx);
  }
  for (const auto &m : req.conversation_history()) {
    request.conversation_history.push_back({m.role(), m.content()});
  }

  set_prompt(rule_drafts::build_rule_builder_prompt(
                 request, state.builder_system_prompt),
             resp);
  set_status_ok(resp);
}

void handle_refine_prompt(const ProviderState &state,
                          const rulekit::v1::RefinePromptRequest &req,
                          Response &resp) {
  if (req.instructions().empty()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "instructions are required");
    return;
  }

  rule_dsl::RuleDraft draft;
  try {
    draft = rule_dsl::parse_rule_draft_json(req.draft_json());
  } catch (const std::runtime_error &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
    return;
  }

  set_prompt(rule_drafts::build_refinement_prompt(draft, req.instructions(),
                                                  state.builder_system_prompt),
             resp);
  set_status_ok(resp);
}

void handle_get_health(const ProviderState &state,
                       const rulekit::v1::GetHealthRequest & /*req*/,
                       Response &resp) {
  *resp.mutable_get_health()->mutable_provider() =
      provider_health::make_provider_health(state.rules.size());
  set_status_ok(resp);
}

void handle_unimplemented(Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "operation not implemented");
}

void dispatch(const ProviderState &state, const rulekit::v1::Request &req,
              Response &resp) {
  using rulekit::v1::Request;

  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  try {
    switch (req.payload_case()) {
    case Request::kHello:
      handle_hello(state, req.hello(), resp);
      break;
    case Request::kListRules:
      handle_list_rules(state, req.list_rules(), resp);
      break;
    case Request::kEvaluate:
      handle_evaluate(state, req.evaluate(), resp);
      break;
    case Request::kEvaluateAll:
      handle_evaluate_all(state, req.evaluate_all(), resp);
      break;
    case Request::kValidateDraft:
      handle_validate_draft(req.validate_draft(), resp);
      break;
    case Request::kExtractDraft:
      handle_extract_draft(req.extract_draft(), resp);
      break;
    case Request::kBuildPrompt:
      handle_build_prompt(state, req.build_prompt(), resp);
      break;
    case Request::kRefinePrompt:
      handle_refine_prompt(state, req.refine_prompt(), resp);
      break;
    case Request::kGetHealth:
      handle_get_health(state, req.get_health(), resp);
      break;
    case Request::PAYLOAD_NOT_SET:
      handle_unimplemented(resp);
      break;
    }
  } catch (const std::exception &e) {
    resp.clear_payload();
    set_status(resp, Status::CODE_INTERNAL, e.what());
  }
}

} // namespace handlers
