// swlint/lint/non_overridable_class_declaration_rule.hpp
//
// `class` methods and properties that cannot be overridden anyway, because
// their class is final or they are private, should say so with `final class`
// or `static`.
//
#pragma once

#include <string_view>
#include <vector>

#include "swlint/ast/ast.hpp"
#include "swlint/basic/source_manager.hpp"
#include "swlint/lint/correction_applier.hpp"
#include "swlint/lint/rule_configuration.hpp"
#include "swlint/lint/rule_description.hpp"
#include "swlint/lint/suppression.hpp"
#include "swlint/lint/violation.hpp"

namespace swlint::lint
{

class NonOverridableClassDeclarationRule
{
public:
  using Configuration = NonOverridableClassDeclarationConfiguration;

  static constexpr std::string_view k_identifier = "non_overridable_class_declaration";

  NonOverridableClassDeclarationRule() = default;
  explicit NonOverridableClassDeclarationRule(Configuration config) : config_(config) {}

  [[nodiscard]] static const RuleDescription & description();

  [[nodiscard]] const Configuration & configuration() const noexcept { return config_; }

  /// Violations in source order. Directive filtering is up to the caller.
  [[nodiscard]] std::vector<StyleViolation> validate(const SourceUnit * unit) const;

  /// Correct every enabled violation of `file`, which `unit` was parsed from.
  [[nodiscard]] CorrectionOutcome correct(
    const SourceUnit * unit, FileId file_id, const SourceFile & file,
    const SuppressionFilter & filter) const;

private:
  Configuration config_;
};

}  // namespace swlint::lint
