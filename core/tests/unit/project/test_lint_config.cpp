// tests/unit/project/test_lint_config.cpp - Unit tests for .swlint.yml loading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "swlint/project/lint_config.hpp"

using namespace swlint;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

constexpr std::string_view k_rule = "non_overridable_class_declaration";

}  // namespace

TEST(LintConfig, ParsesAllKeys)
{
  const auto result = parse_lint_config(
    "included:\n"
    "  - Sources\n"
    "excluded:\n"
    "  - Sources/Generated\n"
    "opt_in_rules:\n"
    "  - non_overridable_class_declaration\n"
    "disabled_rules: [trailing_whitespace]\n"
    "reporter: xcode\n"
    "non_overridable_class_declaration:\n"
    "  severity: error\n"
    "  final_class_modifier: static\n",
    "/project");

  ASSERT_TRUE(result.success) << result.error;
  const LintConfig & config = result.config;
  EXPECT_TRUE(config.from_file);
  ASSERT_EQ(config.included.size(), 1u);
  EXPECT_EQ(config.included[0], std::filesystem::path("/project/Sources"));
  ASSERT_EQ(config.excluded.size(), 1u);
  EXPECT_EQ(config.excluded[0], std::filesystem::path("/project/Sources/Generated"));
  EXPECT_EQ(config.reporter, "xcode");
  EXPECT_EQ(config.disabled_rules.size(), 1u);
  EXPECT_EQ(config.non_overridable_class_declaration.severity, Severity::Error);
  EXPECT_EQ(
    config.non_overridable_class_declaration.final_class_modifier, lint::FinalClassModifier::Static);
  EXPECT_TRUE(config.is_rule_enabled(k_rule, true));
}

TEST(LintConfig, OptInRuleNeedsOptingIn)
{
  const auto result = parse_lint_config("reporter: text\n", "/project");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.is_rule_enabled(k_rule, true));
  EXPECT_TRUE(result.config.is_rule_enabled("default_rule", false));
}

TEST(LintConfig, DisabledAndOnlyRules)
{
  {
    const auto result = parse_lint_config(
      "opt_in_rules: [non_overridable_class_declaration]\n"
      "disabled_rules: [non_overridable_class_declaration]\n",
      "/p");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(result.config.is_rule_enabled(k_rule, true));
  }
  {
    const auto result = parse_lint_config("only_rules: non_overridable_class_declaration\n", "/p");
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.config.is_rule_enabled(k_rule, true));
    EXPECT_FALSE(result.config.is_rule_enabled("default_rule", false));
  }
}

TEST(LintConfig, WithoutConfigurationFileEverythingRuns)
{
  const LintConfig config;
  EXPECT_FALSE(config.from_file);
  EXPECT_TRUE(config.is_rule_enabled(k_rule, true));
  EXPECT_EQ(config.reporter, "text");
}

TEST(LintConfig, EmptyFileIsValid)
{
  const auto result = parse_lint_config("", "/p");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.from_file);
}

TEST(LintConfig, Errors)
{
  EXPECT_EQ(parse_lint_config("- a\n", "/p").error, "configuration root must be a map");
  EXPECT_EQ(
    parse_lint_config("reporter: html\n", "/p").error,
    "invalid reporter: 'html' (must be 'text', 'xcode' or 'json')");
  EXPECT_EQ(parse_lint_config("included: {a: b}\n", "/p").error, "included must be a list");
  EXPECT_EQ(parse_lint_config("colour: red\n", "/p").error, "unknown configuration key: 'colour'");

  const auto rule_error =
    parse_lint_config("non_overridable_class_declaration:\n  severity: loud\n", "/p");
  EXPECT_FALSE(rule_error.success);
  EXPECT_EQ(rule_error.error.rfind("non_overridable_class_declaration: ", 0), 0u) << rule_error.error;

  const auto yaml_error = parse_lint_config("included: [unclosed\n", "/p");
  EXPECT_FALSE(yaml_error.success);
  EXPECT_EQ(yaml_error.error.rfind("failed to parse YAML", 0), 0u) << yaml_error.error;
}

TEST(LintConfig, IsExcluded)
{
  LintConfig config;
  config.excluded.emplace_back("/project/Generated");

  EXPECT_TRUE(config.is_excluded("/project/Generated"));
  EXPECT_TRUE(config.is_excluded("/project/Generated/a.swift"));
  EXPECT_TRUE(config.is_excluded("/project/Generated/../Generated/b.swift"));
  EXPECT_FALSE(config.is_excluded("/project/GeneratedOther/a.swift"));
  EXPECT_FALSE(config.is_excluded("/project/Sources/a.swift"));
}

TEST(LintConfig, LoadAndFindFromDisk)
{
  const TempDir temp(std::filesystem::temp_directory_path() / "swlint_test_config");
  const auto nested = temp.path / "Sources" / "Module";
  std::filesystem::create_directories(nested);

  {
    std::ofstream out(temp.path / ".swlint.yml");
    out << "opt_in_rules:\n  - non_overridable_class_declaration\n";
  }

  const auto found = find_lint_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), ".swlint.yml");

  const auto result = load_lint_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(
    std::filesystem::weakly_canonical(result.config.root),
    std::filesystem::weakly_canonical(temp.path));
  EXPECT_TRUE(result.config.is_rule_enabled(k_rule, true));

  const auto missing = load_lint_config(temp.path / "missing.yml");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error.rfind("configuration file not found", 0), 0u);
}
