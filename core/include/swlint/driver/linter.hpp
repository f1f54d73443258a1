// swlint/driver/linter.hpp - Lint driver
//
// Single entry point for the lint and correct pipelines.
// Used by the CLI and by integration tests.
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"
#include "swlint/lint/violation.hpp"
#include "swlint/project/lint_config.hpp"

namespace swlint
{

// ============================================================================
// Lint Mode
// ============================================================================

enum class LintMode {
  Lint,     ///< Report violations only
  Correct,  ///< Apply corrections and rewrite files in place
};

// ============================================================================
// Lint Options
// ============================================================================

struct LintOptions
{
  /// Lint mode
  LintMode mode = LintMode::Lint;

  /// Files or directories to lint. Empty: config `included`, else its root.
  std::vector<std::filesystem::path> paths;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Lint Result
// ============================================================================

struct FileReport
{
  std::filesystem::path path;
  FileId file_id = FileId::invalid();

  /// Violations left after directive filtering, in source order
  std::vector<lint::StyleViolation> violations;

  /// Applied corrections (Correct mode only)
  std::vector<lint::Correction> corrections;

  /// Whether the file was written back
  bool rewritten = false;
};

struct LintResult
{
  /// False on I/O errors or error-severity violations
  bool success = false;

  /// A path could not be found, read or written
  bool io_error = false;

  /// Parse, directive and I/O diagnostics
  DiagnosticBag diagnostics;

  /// Original contents of every linted file, for reporting
  SourceRegistry sources;

  /// One report per linted file, ordered by path
  std::vector<FileReport> files;

  /// Keyword corrections write, shown as help by the text reporter
  std::string correction_text;

  [[nodiscard]] size_t violation_count() const;
  [[nodiscard]] size_t error_violation_count() const;
  [[nodiscard]] size_t correction_count() const;
};

// ============================================================================
// Linter
// ============================================================================

/**
 * Lint driver that runs the configured rules over a set of files.
 *
 * For each file:
 * 1. Parse into a fresh AST arena
 * 2. Collect suppression directives
 * 3. Validate (Lint mode) or correct and rewrite (Correct mode)
 *
 * Files are processed one after another and share nothing but the registry.
 */
class Linter
{
public:
  /**
   * Run the pipeline over the files selected by `options` and `config`.
   *
   * @param config Project configuration (defaults when no file was found)
   * @param options Lint options
   * @return LintResult with per-file reports and diagnostics
   */
  [[nodiscard]] static LintResult run(const LintConfig & config, const LintOptions & options);

  /**
   * Expand paths into the sorted list of `.swift` files to lint.
   *
   * Directories are searched recursively. Paths matching `config.excluded`
   * are skipped; explicitly named files are kept whatever their extension.
   */
  [[nodiscard]] static std::vector<std::filesystem::path> collect_files(
    const std::vector<std::filesystem::path> & paths, const LintConfig & config,
    DiagnosticBag & diags);

private:
  static void lint_file(
    const std::filesystem::path & path, const LintConfig & config, const LintOptions & options,
    LintResult & result);
};

}  // namespace swlint
