#include <gtest/gtest.h>

#include <string>

#include "swlint/lint/rule_configuration.hpp"

using namespace swlint;
using namespace swlint::lint;

TEST(RuleConfiguration, Defaults)
{
  std::string error;
  const auto config = load_rule_configuration("", error);
  ASSERT_TRUE(config.has_value()) << error;
  EXPECT_EQ(config->severity, Severity::Warning);
  EXPECT_EQ(config->final_class_modifier, FinalClassModifier::FinalClass);
  EXPECT_EQ(config->describe(), "warning, final_class_modifier: final class");
}

TEST(RuleConfiguration, MapWithSeverityAndModifier)
{
  std::string error;
  const auto config = load_rule_configuration(
    "severity: error\n"
    "final_class_modifier: static\n",
    error);
  ASSERT_TRUE(config.has_value()) << error;
  EXPECT_EQ(config->severity, Severity::Error);
  EXPECT_EQ(config->final_class_modifier, FinalClassModifier::Static);
  EXPECT_EQ(replacement_text(config->final_class_modifier), "static");
}

TEST(RuleConfiguration, ScalarSeverityShorthand)
{
  std::string error;
  const auto config = load_rule_configuration("error", error);
  ASSERT_TRUE(config.has_value()) << error;
  EXPECT_EQ(config->severity, Severity::Error);
  EXPECT_EQ(config->final_class_modifier, FinalClassModifier::FinalClass);
}

TEST(RuleConfiguration, FinalIsAcceptedAsFinalClass)
{
  EXPECT_EQ(parse_final_class_modifier("final"), FinalClassModifier::FinalClass);
  EXPECT_EQ(parse_final_class_modifier("final class"), FinalClassModifier::FinalClass);
  EXPECT_EQ(parse_final_class_modifier("static"), FinalClassModifier::Static);
  EXPECT_FALSE(parse_final_class_modifier("class").has_value());
}

TEST(RuleConfiguration, InvalidValuesAreErrors)
{
  std::string error;

  EXPECT_FALSE(load_rule_configuration("severity: fatal", error).has_value());
  EXPECT_NE(error.find("invalid severity 'fatal'"), std::string::npos) << error;

  EXPECT_FALSE(load_rule_configuration("final_class_modifier: sealed", error).has_value());
  EXPECT_NE(error.find("invalid final_class_modifier 'sealed'"), std::string::npos) << error;

  EXPECT_FALSE(load_rule_configuration("unknown_key: 1", error).has_value());
  EXPECT_NE(error.find("unknown configuration key 'unknown_key'"), std::string::npos) << error;

  EXPECT_FALSE(load_rule_configuration("- a\n- b\n", error).has_value());
  EXPECT_EQ(error, "rule configuration must be a severity or a map");
}

TEST(RuleConfiguration, MalformedYaml)
{
  std::string error;
  EXPECT_FALSE(load_rule_configuration("severity: [unclosed", error).has_value());
  EXPECT_NE(error.find("failed to parse YAML"), std::string::npos) << error;
}

TEST(RuleConfiguration, NonScalarValueIsReportedNotThrown)
{
  std::string error;
  EXPECT_FALSE(load_rule_configuration("severity:\n  nested: map\n", error).has_value());
  EXPECT_FALSE(error.empty());
}
