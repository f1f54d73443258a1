// swlint/driver/reporter.cpp - Output formats
//
#include "swlint/driver/reporter.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cctype>
#include <nlohmann/json.hpp>
#include <ostream>

#include "swlint/basic/diagnostic_printer.hpp"
#include "swlint/lint/non_overridable_class_declaration_rule.hpp"

namespace swlint
{

namespace
{

/// Byte length of the identifier starting at `offset` (at least 1).
uint32_t token_length_at(std::string_view content, uint32_t offset)
{
  uint32_t end = offset;
  while (end < content.size()) {
    const auto c = static_cast<unsigned char>(content[end]);
    if (std::isalnum(c) == 0 && c != '_') break;
    ++end;
  }
  return end > offset ? end - offset : 1;
}

std::string_view rule_name(std::string_view rule_id)
{
  const auto & description = lint::NonOverridableClassDeclarationRule::description();
  return rule_id == description.identifier ? description.name : rule_id;
}

}  // namespace

std::optional<ReporterKind> parse_reporter_kind(std::string_view name)
{
  if (name == "text") return ReporterKind::Text;
  if (name == "xcode") return ReporterKind::Xcode;
  if (name == "json") return ReporterKind::Json;
  return std::nullopt;
}

void add_violation_diagnostic(
  DiagnosticBag & diags, const lint::StyleViolation & violation, const SourceFile & file,
  std::string_view correction_text)
{
  const uint32_t begin = violation.position.offset();
  const uint32_t length = token_length_at(file.content(), begin);
  const SourceRange keyword(violation.position.file_id(), begin, begin + length);

  auto builder = diags.report(violation.severity, keyword, violation.reason);
  builder.with_code(violation.rule_id).with_secondary_label(violation.cause, violation.cause_note);
  if (!correction_text.empty()) {
    builder.with_fixit(keyword, std::string(correction_text));
  }
}

std::string format_xcode_violation(const lint::StyleViolation & violation, const SourceFile & file)
{
  const lint::Location loc = lint::make_location(file, violation.position.offset());
  return fmt::format(
    "{}:{}:{}: {}: {} ({})", loc.file.string(), loc.line, loc.character,
    to_string(violation.severity), violation.reason, violation.rule_id);
}

nlohmann::json violations_to_json(const LintResult & result)
{
  nlohmann::json out = nlohmann::json::array();
  for (const auto & report : result.files) {
    const SourceFile * file = result.sources.get_file(report.file_id);
    if (!file) continue;
    for (const auto & v : report.violations) {
      const lint::Location loc = lint::make_location(*file, v.position.offset());
      out.push_back({
        {"file", loc.file.string()},
        {"line", loc.line},
        {"character", loc.character},
        {"severity", std::string(to_string(v.severity))},
        {"type", std::string(rule_name(v.rule_id))},
        {"rule_id", v.rule_id},
        {"reason", v.reason},
      });
    }
  }
  return out;
}

void report_violations(
  std::ostream & os, ReporterKind kind, const LintResult & result, bool use_color)
{
  switch (kind) {
    case ReporterKind::Json:
      os << violations_to_json(result).dump(2) << "\n";
      return;

    case ReporterKind::Xcode:
      for (const auto & report : result.files) {
        const SourceFile * file = result.sources.get_file(report.file_id);
        if (!file) continue;
        for (const auto & v : report.violations) {
          os << format_xcode_violation(v, *file) << "\n";
        }
      }
      return;

    case ReporterKind::Text: {
      DiagnosticBag diags;
      for (const auto & report : result.files) {
        const SourceFile * file = result.sources.get_file(report.file_id);
        if (!file) continue;
        for (const auto & v : report.violations) {
          add_violation_diagnostic(diags, v, *file, result.correction_text);
        }
      }
      DiagnosticPrinter(os, use_color).print_all(diags, result.sources);
      fmt::print(
        os, "Done linting! Found {} violation(s), {} serious in {} file(s).\n",
        result.violation_count(), result.error_violation_count(), result.files.size());
      return;
    }
  }
}

void report_corrections(std::ostream & os, const LintResult & result)
{
  for (const auto & report : result.files) {
    for (const auto & c : report.corrections) {
      fmt::print(
        os, "{}:{}:{} Corrected {}\n", c.location.file.string(), c.location.line,
        c.location.character, c.rule_name);
    }
  }
}

}  // namespace swlint
