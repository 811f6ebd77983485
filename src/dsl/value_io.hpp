#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "dsl/rule_logic.hpp"

namespace rule_dsl {

// Deepest object/array nesting parse_json_value accepts. Each JSON level
// costs up to three protobuf message levels, and protobuf stops at 100.
constexpr int kMaxJsonNestingDepth = 32;

// Parse a JSON document into a Value.
// Throws std::runtime_error if the text is not valid JSON or nests deeper
// than kMaxJsonNestingDepth.
Value parse_json_value(const std::string &json);

// Serialize a Value as JSON, compact unless pretty is set.
// Throws std::runtime_error if the printer rejects the value (e.g. NaN).
std::string to_json(const Value &value, bool pretty = false);

// Convert a YAML node to a Value.
// Quoted scalars stay strings; plain scalars become bool, number or null when
// they read as one. Sequences become lists and maps become structs.
Value yaml_to_value(const YAML::Node &node);

// Structural equality with no type coercion (1 != "1").
bool values_equal(const Value &a, const Value &b);

Value make_number(double n);
Value make_string(const std::string &s);
Value make_bool(bool b);
Value make_null();

// Short kind name for diagnostics ("number", "string", "list", ...)
const char *kind_name(const Value &value);

} // namespace rule_dsl
