#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>

#include "dsl/rule_codec.hpp"
#include "dsl/value_io.hpp"

namespace rulekit_provider {

namespace fs = std::filesystem;

static std::string read_text_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file '" + path + "'");
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

rule_dsl::RuleLogic load_rule_logic_file(const std::string &path) {
  if (fs::path(path).extension() == ".json") {
    return rule_dsl::parse_rule_logic_json(read_text_file(path));
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load rule logic file '" + path +
                             "': " + e.what());
  }
  return rule_dsl::decode_rule_logic(rule_dsl::yaml_to_value(yaml));
}

static void parse_evaluation_section(const YAML::Node &node,
                                     ProviderConfig &config) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'evaluation' section must be a map");
  }

  if (node["workers"]) {
    int workers = 0;
    try {
      workers = node["workers"].as<int>();
    } catch (const YAML::Exception &) {
      throw std::runtime_error("[CONFIG] evaluation.workers must be an integer");
    }
    if (workers < static_cast<int>(kMinWorkers) ||
        workers > static_cast<int>(kMaxWorkers)) {
      throw std::runtime_error("[CONFIG] evaluation.workers must be in range [" +
                               std::to_string(kMinWorkers) + ", " +
                               std::to_string(kMaxWorkers) + "]");
    }
    config.workers = static_cast<std::size_t>(workers);
  }
}

static void parse_builder_section(const YAML::Node &node,
                                  const fs::path &config_dir,
                                  ProviderConfig &config) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'builder' section must be a map");
  }

  if (node["system_prompt"] && node["system_prompt_file"]) {
    throw std::runtime_error("[CONFIG] builder: set only one of "
                             "'system_prompt' and 'system_prompt_file'");
  }

  if (node["system_prompt"]) {
    config.builder_system_prompt = node["system_prompt"].as<std::string>();
  } else if (node["system_prompt_file"]) {
    fs::path prompt_path =
        config_dir / node["system_prompt_file"].as<std::string>();
    try {
      config.builder_system_prompt = read_text_file(prompt_path.string());
    } catch (const std::runtime_error &e) {
      throw std::runtime_error("[CONFIG] builder.system_prompt_file: " +
                               std::string(e.what()));
    }
  }
}

static RuleSpec parse_rule(const YAML::Node &rule_node, std::size_t i,
                           const fs::path &config_dir) {
  const std::string where = "[CONFIG] rules[" + std::to_string(i) + "]";

  if (!rule_node.IsMap()) {
    throw std::runtime_error(where + ": entry must be a map");
  }
  if (!rule_node["id"]) {
    throw std::runtime_error(where + ": missing required field 'id'");
  }

  bool has_file = static_cast<bool>(rule_node["logic_file"]);
  bool has_inline = static_cast<bool>(rule_node["logic"]);
  if (has_file == has_inline) {
    throw std::runtime_error(where +
                             ": exactly one of 'logic_file' or 'logic' "
                             "is required");
  }

  RuleSpec spec;
  try {
    spec.id = rule_node["id"].as<std::string>();
    if (rule_node["name"]) {
      spec.name = rule_node["name"].as<std::string>();
    }
    if (rule_node["priority"]) {
      spec.priority = rule_node["priority"].as<int>();
    }
    if (rule_node["enabled"]) {
      spec.enabled = rule_node["enabled"].as<bool>();
    }
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(where + ": " + e.what());
  }

  if (spec.id.empty()) {
    throw std::runtime_error(where + ": 'id' must not be empty");
  }
  if (spec.priority < 0 || spec.priority > 100) {
    throw std::runtime_error(where + ": priority must be in range [0, 100]");
  }

  try {
    if (has_file) {
      spec.logic_file = rule_node["logic_file"].as<std::string>();
      spec.logic = load_rule_logic_file((config_dir / *spec.logic_file).string());
    } else {
      spec.logic =
          rule_dsl::decode_rule_logic(rule_dsl::yaml_to_value(rule_node["logic"]));
    }
  } catch (const std::exception &e) {
    throw std::runtime_error(where + " '" + spec.id + "': " + e.what());
  }

  return spec;
}

ProviderConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  ProviderConfig config;
  config.config_file_path = fs::absolute(path).string();
  const fs::path config_dir = fs::path(config.config_file_path).parent_path();

  if (yaml["provider"]) {
    if (!yaml["provider"].IsMap()) {
      throw std::runtime_error("[CONFIG] 'provider' section must be a map");
    }
    if (yaml["provider"]["name"]) {
      config.provider_name = yaml["provider"]["name"].as<std::string>();
    }
  }

  if (yaml["evaluation"]) {
    parse_evaluation_section(yaml["evaluation"], config);
  }

  if (yaml["builder"]) {
    parse_builder_section(yaml["builder"], config_dir, config);
  }

  // Parse rules - REQUIRED (may be empty)
  if (!yaml["rules"]) {
    throw std::runtime_error("[CONFIG] Missing required 'rules' section");
  }
  if (!yaml["rules"].IsSequence()) {
    throw std::runtime_error("[CONFIG] 'rules' must be a sequence");
  }

  std::set<std::string> rule_ids; // For duplicate detection

  for (std::size_t i = 0; i < yaml["rules"].size(); ++i) {
    RuleSpec spec = parse_rule(yaml["rules"][i], i, config_dir);

    if (!rule_ids.insert(spec.id).second) {
      throw std::runtime_error("[CONFIG] Duplicate rule ID: " + spec.id);
    }

    config.rules.push_back(std::move(spec));
  }

  return config;
}

rule_engine::RuleSet build_rule_set(const ProviderConfig &config) {
  rule_engine::RuleSet set;
  for (const auto &spec : config.rules) {
    rule_engine::ConfiguredRule rule;
    rule.id = spec.id;
    rule.name = spec.name.empty() ? spec.id : spec.name;
    rule.priority = spec.priority;
    rule.enabled = spec.enabled;
    rule.logic = spec.logic;
    set.add(std::move(rule));
  }
  return set;
}

} // namespace rulekit_provider
