#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "swlint/lint/non_overridable_class_declaration_rule.hpp"
#include "swlint/lint/suppression.hpp"
#include "swlint/test_support/parse_helpers.hpp"

using namespace swlint;
using namespace swlint::lint;

namespace
{

NonOverridableClassDeclarationRule make_rule(const Example & example)
{
  std::string error;
  const auto config = load_rule_configuration(example.configuration, error);
  EXPECT_TRUE(config.has_value()) << error;
  return NonOverridableClassDeclarationRule(config.value_or(NonOverridableClassDeclarationConfiguration{}));
}

/// Offsets of the violations left after directive filtering.
std::vector<uint32_t> violation_offsets(const Example & example, const std::string & code)
{
  auto unit = test_support::parse(code);
  EXPECT_TRUE(unit.diags.empty()) << code;

  const DirectiveSuppressionFilter filter(unit.file_id, *unit.source_file());
  std::vector<uint32_t> out;
  for (const auto & v : make_rule(example).validate(unit.unit)) {
    if (filter.rule_state(TextRange{v.position.offset(), 0}, v.rule_id) == RuleState::Enabled) {
      out.push_back(v.position.offset());
    }
  }
  return out;
}

}  // namespace

TEST(RuleExamples, DescriptionMetadata)
{
  const auto & d = NonOverridableClassDeclarationRule::description();
  EXPECT_EQ(d.identifier, "non_overridable_class_declaration");
  EXPECT_EQ(d.name, "Class Declaration in Final Class");
  EXPECT_EQ(d.kind, RuleKind::Style);
  EXPECT_TRUE(d.opt_in);
  EXPECT_FALSE(d.non_triggering_examples.empty());
  EXPECT_FALSE(d.triggering_examples.empty());
  EXPECT_FALSE(d.corrections.empty());
}

TEST(RuleExamples, NonTriggeringExamplesProduceNoViolations)
{
  for (const auto & example : NonOverridableClassDeclarationRule::description().non_triggering_examples) {
    EXPECT_TRUE(violation_offsets(example, example.code).empty()) << example.code;
  }
}

TEST(RuleExamples, TriggeringExamplesMatchMarkers)
{
  for (const auto & example : NonOverridableClassDeclarationRule::description().triggering_examples) {
    std::vector<uint32_t> markers;
    const std::string code = strip_violation_markers(example.code, &markers);
    ASSERT_FALSE(markers.empty()) << example.code;

    EXPECT_EQ(violation_offsets(example, code), markers) << example.code;
  }
}

TEST(RuleExamples, CorrectionsProduceExpectedOutput)
{
  for (const auto & correction : NonOverridableClassDeclarationRule::description().corrections) {
    const std::string before = strip_violation_markers(correction.before.code);
    auto unit = test_support::parse(before);
    ASSERT_TRUE(unit.diags.empty()) << before;

    const DirectiveSuppressionFilter filter(unit.file_id, *unit.source_file());
    const auto outcome =
      make_rule(correction.before).correct(unit.unit, unit.file_id, *unit.source_file(), filter);

    EXPECT_EQ(outcome.contents, correction.after) << before;
    EXPECT_TRUE(outcome.changed());
  }
}

TEST(RuleExamples, CorrectedOutputIsClean)
{
  for (const auto & correction : NonOverridableClassDeclarationRule::description().corrections) {
    EXPECT_TRUE(violation_offsets(correction.before, correction.after).empty()) << correction.after;
  }
}

TEST(RuleExamples, StripViolationMarkers)
{
  std::vector<uint32_t> offsets;
  const std::string stripped =
    strip_violation_markers("a \xE2\x86\x93" "class b \xE2\x86\x93" "class", &offsets);
  EXPECT_EQ(stripped, "a class b class");
  EXPECT_EQ(offsets, (std::vector<uint32_t>{2, 10}));
}

TEST(RuleExamples, ValidateUsesConfiguredSeverity)
{
  auto unit = test_support::parse("final class C { class func f() {} }\n");

  NonOverridableClassDeclarationConfiguration config;
  config.severity = Severity::Error;
  const NonOverridableClassDeclarationRule rule(config);

  const auto violations = rule.validate(unit.unit);
  ASSERT_EQ(violations.size(), 1u);
  EXPECT_EQ(violations[0].severity, Severity::Error);
  EXPECT_EQ(violations[0].rule_id, "non_overridable_class_declaration");
  EXPECT_EQ(violations[0].position.offset(), 16u);
}
