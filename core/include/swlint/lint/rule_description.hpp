// swlint/lint/rule_description.hpp - Static metadata and examples of a rule
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace swlint::lint
{

enum class RuleKind : uint8_t {
  Lint,
  Idiomatic,
  Style,
  Metrics,
  Performance,
};

[[nodiscard]] constexpr std::string_view to_string(RuleKind k) noexcept
{
  switch (k) {
    case RuleKind::Lint:
      return "lint";
    case RuleKind::Idiomatic:
      return "idiomatic";
    case RuleKind::Style:
      return "style";
    case RuleKind::Metrics:
      return "metrics";
    case RuleKind::Performance:
      return "performance";
  }
  return "";
}

/**
 * Source snippet used to document and test a rule.
 *
 * In triggering examples every expected violation is marked with `↓`
 * directly in front of the offending token. `configuration` is YAML for the
 * rule's configuration section; empty means defaults.
 */
struct Example
{
  std::string code;
  std::string configuration;
};

struct CorrectionExample
{
  Example before;
  std::string after;
};

struct RuleDescription
{
  std::string_view identifier;
  std::string_view name;
  std::string_view description;
  RuleKind kind = RuleKind::Lint;
  bool opt_in = false;

  std::vector<Example> non_triggering_examples;
  std::vector<Example> triggering_examples;
  std::vector<CorrectionExample> corrections;
};

/// UTF-8 encoding of the violation marker used in triggering examples.
inline constexpr std::string_view k_violation_marker = "\xE2\x86\x93";

/// Strip `↓` markers; `offsets` receives the byte offset of each one in the result.
[[nodiscard]] std::string strip_violation_markers(
  std::string_view code, std::vector<uint32_t> * offsets = nullptr);

}  // namespace swlint::lint
