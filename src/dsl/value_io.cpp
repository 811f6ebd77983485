#include "dsl/value_io.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace rule_dsl {

// Deepest {} / [] nesting in the text, ignoring brackets inside strings
static int json_nesting_depth(const std::string &json) {
  int depth = 0;
  int deepest = 0;
  bool in_string = false;
  bool escaped = false;

  for (char c : json) {
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{' || c == '[') {
      deepest = std::max(deepest, ++depth);
    } else if (c == '}' || c == ']') {
      --depth;
    }
  }
  return deepest;
}

Value parse_json_value(const std::string &json) {
  if (json_nesting_depth(json) > kMaxJsonNestingDepth) {
    throw std::runtime_error("Invalid JSON: nesting deeper than " +
                             std::to_string(kMaxJsonNestingDepth) + " levels");
  }

  Value value;
  auto status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("Invalid JSON: " + status.ToString());
  }
  return value;
}

std::string to_json(const Value &value, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string out;
  auto status =
      google::protobuf::util::MessageToJsonString(value, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize value as JSON: " +
                             status.ToString());
  }
  return out;
}

static bool is_plain_null(const std::string &s) {
  return s == "~" || s == "null" || s == "Null" || s == "NULL";
}

static bool is_plain_bool(const std::string &s) {
  return s == "true" || s == "false" || s == "True" || s == "False" ||
         s == "TRUE" || s == "FALSE";
}

Value yaml_to_value(const YAML::Node &node) {
  Value val;

  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    val.set_null_value(google::protobuf::NULL_VALUE);
    break;

  case YAML::NodeType::Scalar: {
    const std::string &scalar_val = node.Scalar();

    // Quoted scalars carry the non-specific "!" tag and are always strings
    if (node.Tag() == "!") {
      val.set_string_value(scalar_val);
      break;
    }

    if (is_plain_null(scalar_val)) {
      val.set_null_value(google::protobuf::NULL_VALUE);
    } else if (is_plain_bool(scalar_val)) {
      val.set_bool_value(node.as<bool>());
    } else {
      double d = 0.0;
      if (YAML::convert<double>::decode(node, d)) {
        val.set_number_value(d);
      } else {
        val.set_string_value(scalar_val);
      }
    }
    break;
  }

  case YAML::NodeType::Sequence: {
    auto *list = val.mutable_list_value();
    for (const auto &item : node) {
      *list->add_values() = yaml_to_value(item);
    }
    break;
  }

  case YAML::NodeType::Map: {
    auto *fields = val.mutable_struct_value()->mutable_fields();
    for (const auto &kv : node) {
      (*fields)[kv.first.as<std::string>()] = yaml_to_value(kv.second);
    }
    break;
  }
  }

  return val;
}

bool values_equal(const Value &a, const Value &b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

Value make_number(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value make_string(const std::string &s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value make_bool(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value make_null() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

const char *kind_name(const Value &value) {
  switch (value.kind_case()) {
  case Value::kNullValue:
    return "null";
  case Value::kNumberValue:
    return "number";
  case Value::kStringValue:
    return "string";
  case Value::kBoolValue:
    return "bool";
  case Value::kStructValue:
    return "object";
  case Value::kListValue:
    return "list";
  case Value::KIND_NOT_SET:
    break;
  }
  return "unset";
}

} // namespace rule_dsl
