// swlint/driver/reporter.hpp - Violation and correction output formats
//
//   text   Rust-style diagnostics with source context
//   xcode  path:line:character: warning: reason (rule_id)
//   json   [{"file", "line", "character", "severity", "type", "rule_id", "reason"}]
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/driver/linter.hpp"

namespace swlint
{

enum class ReporterKind : uint8_t {
  Text,
  Xcode,
  Json,
};

[[nodiscard]] std::optional<ReporterKind> parse_reporter_kind(std::string_view name);

/// Report one violation to `diags`: the offending keyword, what makes it
/// redundant, and the replacement when `correction_text` is not empty.
void add_violation_diagnostic(
  DiagnosticBag & diags, const lint::StyleViolation & violation, const SourceFile & file,
  std::string_view correction_text);

/// One xcode-style line, without the trailing newline.
[[nodiscard]] std::string format_xcode_violation(
  const lint::StyleViolation & violation, const SourceFile & file);

/// Every violation of `result` as a JSON array.
[[nodiscard]] nlohmann::json violations_to_json(const LintResult & result);

/// Print every violation of `result` in the given format.
void report_violations(
  std::ostream & os, ReporterKind kind, const LintResult & result, bool use_color = false);

/// Print one `path:line:character Corrected <name>` line per correction.
void report_corrections(std::ostream & os, const LintResult & result);

}  // namespace swlint
