// swlint/project/lint_config.hpp - Project configuration (.swlint.yml)
//
// Parses and validates .swlint.yml configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swlint/lint/rule_configuration.hpp"

namespace swlint
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (.swlint.yml).
 */
struct LintConfig
{
  /// Paths to lint when none are given on the command line (relative to root)
  std::vector<std::filesystem::path> included;

  /// Paths never linted (relative to root)
  std::vector<std::filesystem::path> excluded;

  std::vector<std::string> disabled_rules;
  std::vector<std::string> opt_in_rules;
  std::vector<std::string> only_rules;

  /// Output format: "text" | "xcode" | "json"
  std::string reporter = "text";

  /// Section `non_overridable_class_declaration`
  lint::NonOverridableClassDeclarationConfiguration non_overridable_class_declaration;

  /// Directory containing .swlint.yml (for resolving relative paths)
  std::filesystem::path root;

  /// False when no configuration file was found; every rule then runs.
  bool from_file = false;

  /**
   * Whether a rule runs under this configuration.
   *
   * `only_rules` wins when set; `disabled_rules` turns a rule off; opt-in
   * rules must be listed in `opt_in_rules`.
   */
  [[nodiscard]] bool is_rule_enabled(std::string_view rule_id, bool opt_in) const;

  /// True if `path` lies inside one of the excluded paths.
  [[nodiscard]] bool is_excluded(const std::filesystem::path & path) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  LintConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(LintConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a .swlint.yml file.
 *
 * @param config_path Path to .swlint.yml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_lint_config(const std::filesystem::path & config_path);

/**
 * Parse configuration YAML text.
 *
 * @param yaml_text Contents of a configuration file
 * @param root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_lint_config(
  std::string_view yaml_text, const std::filesystem::path & root);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to .swlint.yml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_lint_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_lint_config_file_name = ".swlint.yml";

}  // namespace swlint
