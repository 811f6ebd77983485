#include "dsl/rule_codec.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "dsl/value_io.hpp"

namespace rule_dsl {

namespace {

[[noreturn]] void fail(const char *prefix, const std::string &where,
                       const std::string &msg) {
  throw std::runtime_error(std::string(prefix) + " " + where + ": " + msg);
}

const Value *find_field(const Struct &obj, const std::string &key) {
  auto it = obj.fields().find(key);
  if (it == obj.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

const Struct &expect_object(const Value &value, const char *prefix,
                            const std::string &where) {
  if (value.kind_case() != Value::kStructValue) {
    fail(prefix, where,
         std::string("expected an object, got ") + kind_name(value));
  }
  return value.struct_value();
}

std::string read_string(const Struct &obj, const std::string &key,
                        const char *prefix, const std::string &where) {
  const Value *v = find_field(obj, key);
  if (!v) {
    fail(prefix, where, "missing required field '" + key + "'");
  }
  if (v->kind_case() != Value::kStringValue) {
    fail(prefix, where, "'" + key + "' must be a string");
  }
  return v->string_value();
}

std::optional<std::string> read_optional_string(const Struct &obj,
                                                const std::string &key,
                                                const char *prefix,
                                                const std::string &where) {
  const Value *v = find_field(obj, key);
  if (!v || v->kind_case() == Value::kNullValue) {
    return std::nullopt;
  }
  if (v->kind_case() != Value::kStringValue) {
    fail(prefix, where, "'" + key + "' must be a string");
  }
  return v->string_value();
}

int read_int(const Value &v, const std::string &key, const char *prefix,
             const std::string &where) {
  if (v.kind_case() != Value::kNumberValue ||
      std::floor(v.number_value()) != v.number_value() ||
      v.number_value() < std::numeric_limits<int>::min() ||
      v.number_value() > std::numeric_limits<int>::max()) {
    fail(prefix, where, "'" + key + "' must be an integer");
  }
  return static_cast<int>(v.number_value());
}

// Enum names are looked up through the parse_* functions, which throw a
// location-free message; prepend the location here.
template <typename F>
auto read_enum(const Struct &obj, const std::string &key, F parse,
               const char *prefix, const std::string &where)
    -> decltype(parse(std::string())) {
  std::string name = read_string(obj, key, prefix, where);
  try {
    return parse(name);
  } catch (const std::runtime_error &e) {
    fail(prefix, where, e.what());
  }
}

constexpr const char *kLogicPrefix = "[RULE LOGIC]";
constexpr const char *kDraftPrefix = "[RULE DRAFT]";

Condition decode_condition(const Struct &obj, const std::string &where) {
  Condition cond;
  cond.field = read_string(obj, "field", kLogicPrefix, where);
  cond.op = read_enum(obj, "operator", parse_condition_operator, kLogicPrefix,
                      where);

  if (const Value *v = find_field(obj, "value")) {
    cond.value = *v;
  }
  if (find_field(obj, "valueType")) {
    cond.value_type = read_enum(obj, "valueType", parse_condition_value_type,
                                kLogicPrefix, where);
  }
  if (auto desc = read_optional_string(obj, "description", kLogicPrefix, where)) {
    cond.description = *desc;
  }

  if (operator_requires_value(cond.op) && !cond.value) {
    fail(kLogicPrefix, where,
         std::string("operator '") + to_string(cond.op) +
             "' requires a 'value'");
  }
  if (cond.op == ConditionOperator::Between &&
      (cond.value->kind_case() != Value::kListValue ||
       cond.value->list_value().values_size() != 2)) {
    fail(kLogicPrefix, where,
         "operator 'between' requires a 2-element [low, high] value");
  }

  return cond;
}

ConditionGroup decode_group(const Value &value, const std::string &where,
                            int depth);

ConditionNode decode_node(const Value &value, const std::string &where,
                          int depth) {
  const Struct &obj = expect_object(value, kLogicPrefix, where);

  bool is_group = find_field(obj, "op") && find_field(obj, "conditions");
  bool is_leaf = find_field(obj, "field") && find_field(obj, "operator");

  if (is_group) {
    return ConditionNode{decode_group(value, where, depth + 1)};
  }
  if (is_leaf) {
    return ConditionNode{decode_condition(obj, where)};
  }
  fail(kLogicPrefix, where,
       "entry must be a condition (field + operator) or a group "
       "(op + conditions)");
}

ConditionGroup decode_group(const Value &value, const std::string &where,
                            int depth) {
  if (depth > kMaxGroupDepth) {
    fail(kLogicPrefix, where,
         "condition groups nest deeper than " + std::to_string(kMaxGroupDepth) +
             " levels");
  }
  const Struct &obj = expect_object(value, kLogicPrefix, where);

  ConditionGroup group;
  group.op = read_enum(obj, "op", parse_logical_operator, kLogicPrefix, where);

  const Value *conditions = find_field(obj, "conditions");
  if (!conditions) {
    fail(kLogicPrefix, where, "missing required field 'conditions'");
  }
  if (conditions->kind_case() != Value::kListValue) {
    fail(kLogicPrefix, where, "'conditions' must be a list");
  }

  const auto &items = conditions->list_value().values();
  group.conditions.reserve(static_cast<std::size_t>(items.size()));
  for (int i = 0; i < items.size(); ++i) {
    group.conditions.push_back(decode_node(
        items[i], where + ".conditions[" + std::to_string(i) + "]", depth));
  }
  return group;
}

Action decode_action(const Value &value, const std::string &where) {
  const Struct &obj = expect_object(value, kLogicPrefix, where);

  Action action;
  action.type = read_enum(obj, "type", parse_action_type, kLogicPrefix, where);
  if (auto target = read_optional_string(obj, "target", kLogicPrefix, where)) {
    action.target = *target;
  }
  if (find_field(obj, "operator")) {
    action.op = read_enum(obj, "operator", parse_action_operator, kLogicPrefix,
                          where);
  }
  if (const Value *v = find_field(obj, "value")) {
    action.value = *v;
  }
  action.message = read_optional_string(obj, "message", kLogicPrefix, where);
  if (find_field(obj, "severity")) {
    action.severity = read_enum(obj, "severity", parse_message_severity,
                                kLogicPrefix, where);
  }
  if (auto desc = read_optional_string(obj, "description", kLogicPrefix, where)) {
    action.description = *desc;
  }
  return action;
}

std::vector<Action> decode_actions(const Value &value,
                                   const std::string &where) {
  if (value.kind_case() != Value::kListValue) {
    fail(kLogicPrefix, where, "must be a list of actions");
  }
  std::vector<Action> actions;
  const auto &items = value.list_value().values();
  actions.reserve(static_cast<std::size_t>(items.size()));
  for (int i = 0; i < items.size(); ++i) {
    actions.push_back(
        decode_action(items[i], where + "[" + std::to_string(i) + "]"));
  }
  return actions;
}

Value group_to_value(const ConditionGroup &group);

Value node_to_value(const ConditionNode &node) {
  if (const auto *cond = std::get_if<Condition>(&node.node)) {
    return condition_to_value(*cond);
  }
  return group_to_value(std::get<ConditionGroup>(node.node));
}

Value group_to_value(const ConditionGroup &group) {
  Value out;
  auto &fields = *out.mutable_struct_value()->mutable_fields();
  fields["op"] = make_string(to_string(group.op));
  auto *list = fields["conditions"].mutable_list_value();
  for (const auto &node : group.conditions) {
    *list->add_values() = node_to_value(node);
  }
  return out;
}

Value actions_to_value(const std::vector<Action> &actions) {
  Value out;
  auto *list = out.mutable_list_value();
  for (const auto &action : actions) {
    *list->add_values() = action_to_value(action);
  }
  return out;
}

} // namespace

RuleLogic decode_rule_logic(const Value &value) {
  const Struct &obj = expect_object(value, kLogicPrefix, "logic");

  RuleLogic logic;
  if (const Value *version = find_field(obj, "version")) {
    logic.version = read_int(*version, "version", kLogicPrefix, "logic");
  }

  const Value *if_value = find_field(obj, "if");
  if (!if_value) {
    fail(kLogicPrefix, "logic", "missing required field 'if'");
  }
  logic.if_group = decode_group(*if_value, "if", 1);

  const Value *then_value = find_field(obj, "then");
  if (!then_value) {
    fail(kLogicPrefix, "logic", "missing required field 'then'");
  }
  logic.then_actions = decode_actions(*then_value, "then");

  if (const Value *else_value = find_field(obj, "else")) {
    if (else_value->kind_case() != Value::kNullValue) {
      logic.else_actions = decode_actions(*else_value, "else");
    }
  }

  return logic;
}

RuleLogic parse_rule_logic_json(const std::string &json) {
  Value value;
  try {
    value = parse_json_value(json);
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(std::string(kLogicPrefix) + " " + e.what());
  }
  return decode_rule_logic(value);
}

Value condition_to_value(const Condition &condition) {
  Value out;
  auto &fields = *out.mutable_struct_value()->mutable_fields();
  fields["field"] = make_string(condition.field);
  fields["operator"] = make_string(to_string(condition.op));
  if (condition.value) {
    fields["value"] = *condition.value;
  }
  if (condition.value_type) {
    fields["valueType"] = make_string(to_string(*condition.value_type));
  }
  if (!condition.description.empty()) {
    fields["description"] = make_string(condition.description);
  }
  return out;
}

Value action_to_value(const Action &action) {
  Value out;
  auto &fields = *out.mutable_struct_value()->mutable_fields();
  fields["type"] = make_string(to_string(action.type));
  fields["target"] = make_string(action.target);
  if (action.op) {
    fields["operator"] = make_string(to_string(*action.op));
  }
  if (action.value) {
    fields["value"] = *action.value;
  }
  if (action.message) {
    fields["message"] = make_string(*action.message);
  }
  if (action.severity) {
    fields["severity"] = make_string(to_string(*action.severity));
  }
  if (!action.description.empty()) {
    fields["description"] = make_string(action.description);
  }
  return out;
}

Value rule_logic_to_value(const RuleLogic &logic) {
  Value out;
  auto &fields = *out.mutable_struct_value()->mutable_fields();
  fields["version"] = make_number(logic.version);
  fields["if"] = group_to_value(logic.if_group);
  fields["then"] = actions_to_value(logic.then_actions);
  if (logic.else_actions) {
    fields["else"] = actions_to_value(*logic.else_actions);
  }
  return out;
}

std::string rule_logic_to_json(const RuleLogic &logic) {
  return to_json(rule_logic_to_value(logic));
}

RuleDraft decode_rule_draft(const Value &value) {
  const Struct &obj = expect_object(value, kDraftPrefix, "draft");

  auto opt = [&](const char *key) {
    return read_optional_string(obj, key, kDraftPrefix, "draft")
        .value_or(std::string());
  };

  RuleDraft draft;
  draft.name = opt("name");
  draft.rule_type = opt("ruleType");
  draft.rule_category = opt("ruleCategory");
  draft.target_id = read_optional_string(obj, "targetId", kDraftPrefix, "draft");
  draft.status = opt("status");
  draft.reference =
      read_optional_string(obj, "reference", kDraftPrefix, "draft");
  draft.source_text = opt("sourceText");
  draft.condition_text = opt("conditionText");
  draft.outcome_text = opt("outcomeText");

  if (const Value *v = find_field(obj, "proprietary")) {
    if (v->kind_case() != Value::kBoolValue) {
      fail(kDraftPrefix, "draft", "'proprietary' must be a boolean");
    }
    draft.proprietary = v->bool_value();
  }
  if (const Value *v = find_field(obj, "priority")) {
    draft.priority = read_int(*v, "priority", kDraftPrefix, "draft");
  }

  const Value *logic = find_field(obj, "logic");
  if (!logic) {
    fail(kDraftPrefix, "draft", "missing required field 'logic'");
  }
  draft.logic = decode_rule_logic(*logic);
  return draft;
}

RuleDraft parse_rule_draft_json(const std::string &json) {
  Value value;
  try {
    value = parse_json_value(json);
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(std::string(kDraftPrefix) + " " + e.what());
  }
  return decode_rule_draft(value);
}

Value rule_draft_to_value(const RuleDraft &draft) {
  Value out;
  auto &fields = *out.mutable_struct_value()->mutable_fields();
  auto nullable = [](const std::optional<std::string> &s) {
    return s ? make_string(*s) : make_null();
  };

  fields["name"] = make_string(draft.name);
  fields["ruleType"] = make_string(draft.rule_type);
  fields["ruleCategory"] = make_string(draft.rule_category);
  fields["targetId"] = nullable(draft.target_id);
  fields["status"] = make_string(draft.status);
  fields["proprietary"] = make_bool(draft.proprietary);
  fields["priority"] = make_number(draft.priority);
  fields["reference"] = nullable(draft.reference);
  fields["sourceText"] = make_string(draft.source_text);
  fields["conditionText"] = make_string(draft.condition_text);
  fields["outcomeText"] = make_string(draft.outcome_text);
  fields["logic"] = rule_logic_to_value(draft.logic);
  return out;
}

std::string rule_draft_to_json(const RuleDraft &draft) {
  return to_json(rule_draft_to_value(draft));
}

} // namespace rule_dsl
