// swlint/project/lint_config.cpp - Project configuration implementation
//
#include "swlint/project/lint_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "swlint/lint/non_overridable_class_declaration_rule.hpp"

namespace swlint
{

namespace
{

bool contains_id(const std::vector<std::string> & ids, std::string_view id)
{
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

/// Parse a list of strings; a single scalar is accepted as a one-element list.
std::optional<std::vector<std::string>> parse_string_list(
  const YAML::Node & node, std::string_view key, std::string & error)
{
  std::vector<std::string> out;
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
    return out;
  }
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return std::nullopt;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(key) + " entries must be strings";
      return std::nullopt;
    }
    out.push_back(item.as<std::string>());
  }
  return out;
}

bool is_known_reporter(std::string_view name)
{
  return name == "text" || name == "xcode" || name == "json";
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & base)
{
  LintConfig config;
  config.root = base;
  config.from_file = true;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  for (const auto & entry : root) {
    const auto key = entry.first.as<std::string>();
    const YAML::Node & value = entry.second;
    std::string error;

    if (key == "included" || key == "excluded") {
      auto paths = parse_string_list(value, key, error);
      if (!paths) {
        return ConfigLoadResult::fail(error);
      }
      auto & target = key == "included" ? config.included : config.excluded;
      for (const auto & p : *paths) {
        target.push_back(base / p);
      }
    } else if (key == "disabled_rules" || key == "opt_in_rules" || key == "only_rules") {
      auto ids = parse_string_list(value, key, error);
      if (!ids) {
        return ConfigLoadResult::fail(error);
      }
      auto & target = key == "disabled_rules" ? config.disabled_rules
                      : key == "opt_in_rules" ? config.opt_in_rules
                                              : config.only_rules;
      target = std::move(*ids);
    } else if (key == "reporter") {
      config.reporter = value.as<std::string>();
      if (!is_known_reporter(config.reporter)) {
        return ConfigLoadResult::fail(
          "invalid reporter: '" + config.reporter + "' (must be 'text', 'xcode' or 'json')");
      }
    } else if (key == lint::NonOverridableClassDeclarationRule::k_identifier) {
      auto rule = lint::parse_rule_configuration(value, error);
      if (!rule) {
        return ConfigLoadResult::fail(key + ": " + error);
      }
      config.non_overridable_class_declaration = *rule;
    } else {
      return ConfigLoadResult::fail("unknown configuration key: '" + key + "'");
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

bool LintConfig::is_rule_enabled(std::string_view rule_id, bool opt_in) const
{
  if (!from_file) {
    return true;
  }
  if (!only_rules.empty()) {
    return contains_id(only_rules, rule_id);
  }
  if (contains_id(disabled_rules, rule_id)) {
    return false;
  }
  return !opt_in || contains_id(opt_in_rules, rule_id);
}

bool LintConfig::is_excluded(const std::filesystem::path & path) const
{
  namespace fs = std::filesystem;
  const fs::path normalized = fs::absolute(path).lexically_normal();
  for (const auto & ex : excluded) {
    const fs::path ex_norm = fs::absolute(ex).lexically_normal();
    const auto rel = normalized.lexically_relative(ex_norm);
    if (!rel.empty() && *rel.begin() != "..") {
      return true;
    }
  }
  return false;
}

ConfigLoadResult parse_lint_config(std::string_view yaml_text, const std::filesystem::path & root)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)), root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_lint_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path, std::ios::binary);
  if (!in) {
    return ConfigLoadResult::fail("cannot read configuration file: " + config_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  return parse_lint_config(ss.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_lint_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_lint_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace swlint
