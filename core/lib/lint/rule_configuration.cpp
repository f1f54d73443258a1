// swlint/lint/rule_configuration.cpp
#include "swlint/lint/rule_configuration.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace swlint::lint
{

std::optional<FinalClassModifier> parse_final_class_modifier(std::string_view s)
{
  if (s == "final class" || s == "final") {
    return FinalClassModifier::FinalClass;
  }
  if (s == "static") {
    return FinalClassModifier::Static;
  }
  return std::nullopt;
}

std::optional<Severity> parse_violation_severity(std::string_view s)
{
  if (s == "warning") {
    return Severity::Warning;
  }
  if (s == "error") {
    return Severity::Error;
  }
  return std::nullopt;
}

std::string NonOverridableClassDeclarationConfiguration::describe() const
{
  return fmt::format(
    "{}, final_class_modifier: {}", to_string(severity), replacement_text(final_class_modifier));
}

std::optional<NonOverridableClassDeclarationConfiguration> parse_rule_configuration(
  const YAML::Node & node, std::string & error)
{
  NonOverridableClassDeclarationConfiguration config;

  if (!node || node.IsNull()) {
    return config;
  }

  try {
    if (node.IsScalar()) {
      const auto severity = parse_violation_severity(node.as<std::string>());
      if (!severity) {
        error = fmt::format("invalid severity '{}' (must be 'warning' or 'error')", node.Scalar());
        return std::nullopt;
      }
      config.severity = *severity;
      return config;
    }

    if (!node.IsMap()) {
      error = "rule configuration must be a severity or a map";
      return std::nullopt;
    }

    for (const auto & entry : node) {
      const auto key = entry.first.as<std::string>();
      const YAML::Node & value = entry.second;

      if (key == "severity") {
        const auto severity = parse_violation_severity(value.as<std::string>());
        if (!severity) {
          error = fmt::format("invalid severity '{}' (must be 'warning' or 'error')", value.Scalar());
          return std::nullopt;
        }
        config.severity = *severity;
      } else if (key == "final_class_modifier") {
        const auto modifier = parse_final_class_modifier(value.as<std::string>());
        if (!modifier) {
          error = fmt::format(
            "invalid final_class_modifier '{}' (must be 'final class' or 'static')", value.Scalar());
          return std::nullopt;
        }
        config.final_class_modifier = *modifier;
      } else {
        error = fmt::format("unknown configuration key '{}'", key);
        return std::nullopt;
      }
    }
  } catch (const YAML::Exception & e) {
    error = fmt::format("invalid rule configuration: {}", e.what());
    return std::nullopt;
  }

  return config;
}

std::optional<NonOverridableClassDeclarationConfiguration> load_rule_configuration(
  std::string_view yaml_text, std::string & error)
{
  if (yaml_text.empty()) {
    return NonOverridableClassDeclarationConfiguration{};
  }

  YAML::Node node;
  try {
    node = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    error = fmt::format("failed to parse YAML: {}", e.what());
    return std::nullopt;
  }
  return parse_rule_configuration(node, error);
}

}  // namespace swlint::lint
