// swlint/lint/suppression.hpp - Rule enable/disable lookup
//
// Directives live in comments:
//
//   // swlint:disable non_overridable_class_declaration
//   // swlint:enable all
//   class func f() {}  // swlint:disable:this non_overridable_class_declaration
//   // swlint:disable:next non_overridable_class_declaration
//   // swlint:disable:previous non_overridable_class_declaration
//
// The `swiftlint:` prefix is accepted as well. Text after a lone `-` is an
// explanation and ignored.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint::lint
{

enum class RuleState : uint8_t {
  Enabled,
  Disabled,
  Unresolvable,  ///< range cannot be mapped onto the file
};

/// Answers whether a rule is enabled at a range of the file contents.
class SuppressionFilter
{
public:
  virtual ~SuppressionFilter() = default;

  [[nodiscard]] virtual RuleState rule_state(TextRange range, std::string_view rule_id) const = 0;

protected:
  SuppressionFilter() = default;
  SuppressionFilter(const SuppressionFilter &) = default;
  SuppressionFilter & operator=(const SuppressionFilter &) = default;
};

/// Every rule enabled everywhere inside the contents.
class NullSuppressionFilter final : public SuppressionFilter
{
public:
  explicit NullSuppressionFilter(const SourceFile & file) : file_(file) {}

  [[nodiscard]] RuleState rule_state(TextRange range, std::string_view rule_id) const override;

private:
  const SourceFile & file_;
};

enum class DirectiveAction : uint8_t {
  Disable,
  Enable,
};

enum class DirectiveScope : uint8_t {
  Region,        ///< from the directive onward
  ThisLine,      ///< :this
  NextLine,      ///< :next
  PreviousLine,  ///< :previous
};

struct Directive
{
  DirectiveAction action = DirectiveAction::Disable;
  DirectiveScope scope = DirectiveScope::Region;
  std::vector<std::string> rules;  ///< rule identifiers, or "all"
  uint32_t offset = 0;             ///< start of the comment
  uint32_t line = 0;               ///< 1-based line of the comment

  [[nodiscard]] bool applies_to(std::string_view rule_id) const;
};

/**
 * Parse one comment's text.
 *
 * Returns std::nullopt both when the comment holds no directive (error left
 * empty) and when the directive is malformed (error set).
 */
[[nodiscard]] std::optional<Directive> parse_directive(std::string_view comment, std::string & error);

/**
 * Suppression filter driven by directive comments of one file.
 *
 * Region directives apply in source order; line-scoped directives override
 * the region state on their line only.
 */
class DirectiveSuppressionFilter final : public SuppressionFilter
{
public:
  /// Malformed directives are reported to `diags` as warnings when given.
  DirectiveSuppressionFilter(FileId file_id, const SourceFile & file, DiagnosticBag * diags = nullptr);

  [[nodiscard]] RuleState rule_state(TextRange range, std::string_view rule_id) const override;

  [[nodiscard]] const std::vector<Directive> & directives() const noexcept { return directives_; }

private:
  const SourceFile & file_;
  std::vector<Directive> directives_;
};

}  // namespace swlint::lint
