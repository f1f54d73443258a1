// swlint/lint/rule_configuration.hpp - Options of non_overridable_class_declaration
//
// Parsed from the rule's section of .swlint.yml:
//
//   non_overridable_class_declaration:
//     severity: error
//     final_class_modifier: static
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "swlint/basic/diagnostic.hpp"

namespace YAML
{
class Node;
}

namespace swlint::lint
{

/// Keyword written in place of a redundant `class` modifier.
enum class FinalClassModifier : uint8_t {
  FinalClass,  ///< `final class`
  Static,      ///< `static`
};

[[nodiscard]] constexpr std::string_view replacement_text(FinalClassModifier m) noexcept
{
  switch (m) {
    case FinalClassModifier::FinalClass:
      return "final class";
    case FinalClassModifier::Static:
      return "static";
  }
  return "";
}

[[nodiscard]] std::optional<FinalClassModifier> parse_final_class_modifier(std::string_view s);
[[nodiscard]] std::optional<Severity> parse_violation_severity(std::string_view s);

struct NonOverridableClassDeclarationConfiguration
{
  Severity severity = Severity::Warning;
  FinalClassModifier final_class_modifier = FinalClassModifier::FinalClass;

  /// Short form for `swlint rules`, e.g. "warning, final_class_modifier: final class".
  [[nodiscard]] std::string describe() const;
};

/**
 * Parse a rule configuration node on top of the defaults.
 *
 * Accepts a bare severity scalar (`error`) or a map with `severity` and
 * `final_class_modifier`. Unknown keys and invalid values are errors.
 *
 * @param node YAML node of the rule section (may be null: defaults)
 * @param error Receives the message on failure
 */
[[nodiscard]] std::optional<NonOverridableClassDeclarationConfiguration> parse_rule_configuration(
  const YAML::Node & node, std::string & error);

/// Same as above, from YAML text. Empty text yields the defaults.
[[nodiscard]] std::optional<NonOverridableClassDeclarationConfiguration> load_rule_configuration(
  std::string_view yaml_text, std::string & error);

}  // namespace swlint::lint
