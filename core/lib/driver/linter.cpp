// swlint/driver/linter.cpp - Lint driver implementation
//
#include "swlint/driver/linter.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <system_error>

#include "swlint/ast/ast_context.hpp"
#include "swlint/lint/non_overridable_class_declaration_rule.hpp"
#include "swlint/lint/suppression.hpp"
#include "swlint/syntax/frontend.hpp"

namespace swlint
{

namespace
{

using lint::NonOverridableClassDeclarationRule;

bool is_swift_file(const std::filesystem::path & path)
{
  return path.extension() == ".swift";
}

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

bool write_file(const std::filesystem::path & path, std::string_view contents)
{
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  return static_cast<bool>(out);
}

}  // namespace

size_t LintResult::violation_count() const
{
  size_t n = 0;
  for (const auto & f : files) n += f.violations.size();
  return n;
}

size_t LintResult::error_violation_count() const
{
  size_t n = 0;
  for (const auto & f : files) {
    n += static_cast<size_t>(std::count_if(
      f.violations.begin(), f.violations.end(),
      [](const lint::StyleViolation & v) { return v.severity == Severity::Error; }));
  }
  return n;
}

size_t LintResult::correction_count() const
{
  size_t n = 0;
  for (const auto & f : files) n += f.corrections.size();
  return n;
}

std::vector<std::filesystem::path> Linter::collect_files(
  const std::vector<std::filesystem::path> & paths, const LintConfig & config,
  DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  std::vector<fs::path> out;

  for (const auto & input : paths) {
    std::error_code ec;
    if (!fs::exists(input, ec)) {
      diags.report_error(SourceRange{}, "path not found: " + input.string()).with_code("io");
      continue;
    }

    if (config.is_excluded(input)) {
      continue;
    }

    if (!fs::is_directory(input, ec)) {
      out.push_back(input.lexically_normal());
      continue;
    }

    fs::recursive_directory_iterator it(input, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      diags.report_error(SourceRange{}, "cannot read directory: " + input.string())
        .with_code("io");
      continue;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        diags.report_error(SourceRange{}, "cannot read directory: " + input.string())
          .with_code("io");
        break;
      }
      const auto & entry = *it;
      if (entry.is_directory(ec) && config.is_excluded(entry.path())) {
        it.disable_recursion_pending();
        continue;
      }
      if (entry.is_regular_file(ec) && is_swift_file(entry.path()) &&
          !config.is_excluded(entry.path())) {
        out.push_back(entry.path().lexically_normal());
      }
    }
  }

  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

LintResult Linter::run(const LintConfig & config, const LintOptions & options)
{
  LintResult result;
  result.correction_text =
    std::string(lint::replacement_text(config.non_overridable_class_declaration.final_class_modifier));

  // Determine the paths to lint
  std::vector<std::filesystem::path> roots = options.paths;
  if (roots.empty()) {
    if (!config.included.empty()) {
      roots = config.included;
    } else if (config.from_file) {
      roots.push_back(config.root);
    } else {
      roots.emplace_back(".");
    }
  }

  const auto files = collect_files(roots, config, result.diagnostics);
  result.io_error = result.diagnostics.has_errors();

  if (options.verbose) {
    std::cerr << "Found " << files.size() << " Swift file(s)\n";
  }

  for (const auto & path : files) {
    lint_file(path, config, options, result);
  }

  result.success = !result.io_error && result.error_violation_count() == 0;
  return result;
}

void Linter::lint_file(
  const std::filesystem::path & path, const LintConfig & config, const LintOptions & options,
  LintResult & result)
{
  const bool correcting = options.mode == LintMode::Correct;
  if (options.verbose) {
    std::cerr << (correcting ? "Correcting: " : "Linting: ") << path.string() << "\n";
  }

  auto contents = read_file(path);
  if (!contents) {
    result.diagnostics.report_error(SourceRange{}, "cannot read file: " + path.string())
      .with_code("io");
    result.io_error = true;
    return;
  }

  FileReport report;
  report.path = path;

  const auto & description = NonOverridableClassDeclarationRule::description();
  if (!config.is_rule_enabled(description.identifier, description.opt_in)) {
    report.file_id = result.sources.register_file(path, std::move(*contents));
    result.files.push_back(std::move(report));
    return;
  }

  // Each file gets its own arena and diagnostics; the arena dies with this call,
  // the diagnostics are folded into the result.
  AstContext ast;
  DiagnosticBag file_diags;
  const ParseOutput parsed =
    parse_source(result.sources, path, std::move(*contents), ast, file_diags);
  report.file_id = parsed.file_id;

  const SourceFile * file = result.sources.get_file(parsed.file_id);
  if (!file) {
    result.diagnostics.merge(std::move(file_diags));
    result.io_error = true;
    return;
  }

  const lint::DirectiveSuppressionFilter filter(parsed.file_id, *file, &file_diags);
  const NonOverridableClassDeclarationRule rule(config.non_overridable_class_declaration);

  if (correcting) {
    auto outcome = rule.correct(parsed.unit, parsed.file_id, *file, filter);
    if (outcome.changed()) {
      if (!write_file(path, outcome.contents)) {
        file_diags.report_error(SourceRange{}, "cannot write file: " + path.string())
          .with_code("io");
        result.io_error = true;
      } else {
        report.rewritten = true;
        // Report corrections in source order.
        std::reverse(outcome.corrections.begin(), outcome.corrections.end());
        report.corrections = std::move(outcome.corrections);
      }
    }
  } else {
    for (auto & v : rule.validate(parsed.unit)) {
      const TextRange at{v.position.offset(), 0};
      if (filter.rule_state(at, v.rule_id) == lint::RuleState::Enabled) {
        report.violations.push_back(std::move(v));
      }
    }
  }

  if (options.verbose) {
    std::cerr << "  " << (correcting ? report.corrections.size() : report.violations.size())
              << (correcting ? " correction(s)\n" : " violation(s)\n");
  }

  result.diagnostics.merge(std::move(file_diags));
  result.files.push_back(std::move(report));
}

}  // namespace swlint
