// swlint - Swift style linter command line interface
//
// Usage:
//   swlint lint [paths...] [--config file] [--reporter text|xcode|json] [--strict]
//   swlint correct [paths...] [--config file]
//   swlint rules [identifier]
//   swlint dump-ast <file.swift>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "swlint/ast/ast_context.hpp"
#include "swlint/ast/json_visitor.hpp"
#include "swlint/basic/diagnostic_printer.hpp"
#include "swlint/driver/linter.hpp"
#include "swlint/driver/reporter.hpp"
#include "swlint/lint/non_overridable_class_declaration_rule.hpp"
#include "swlint/project/lint_config.hpp"
#include "swlint/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_violations = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "swlint v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  lint [paths...]          Report style violations (default)\n"
            << "  correct [paths...]       Correct violations in place (alias: autocorrect)\n"
            << "  rules [identifier]       Show available rules\n"
            << "  dump-ast <file.swift>    Print the parsed declaration tree as JSON\n\n"
            << "Options:\n"
            << "  --config <path>          Configuration file (default: nearest .swlint.yml)\n"
            << "  --reporter <name>        Output format: text, xcode, json\n"
            << "  --strict                 Fail on warnings as well as errors\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

/// Print diagnostics to stderr. Syntax diagnostics are only shown in verbose mode.
void print_diagnostics(
  const swlint::DiagnosticBag & diagnostics, const swlint::SourceRegistry & sources, bool verbose)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  swlint::DiagnosticPrinter printer(std::cerr, use_color);

  swlint::DiagnosticBag shown;
  for (const auto & diag : diagnostics) {
    if (diag.code == "syntax" && !verbose) continue;
    shown.add(diag);
  }
  printer.print_all(shown, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::string config_path;
  std::string reporter;
  bool strict = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.command = "lint";
    return args;
  }

  int first = 1;
  const std::string head = argv[1];
  if (head == "-h" || head == "--help") {
    args.show_help = true;
    return args;
  }
  if (!head.empty() && head[0] == '-') {
    args.command = "lint";
  } else {
    args.command = head;
    first = 2;
  }

  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--config" || arg == "--reporter") {
      if (i + 1 >= argc) {
        args.error = "missing value for " + arg;
        return args;
      }
      (arg == "--config" ? args.config_path : args.reporter) = argv[++i];
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option: " + arg;
      return args;
    } else {
      args.inputs.push_back(arg);
    }
  }

  return args;
}

/// Load the configuration named by --config, else the nearest .swlint.yml.
bool resolve_config(const CommandArgs & args, swlint::LintConfig & config)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = swlint::find_lint_config(fs::current_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << swlint::k_lint_config_file_name << " found, using defaults\n";
    }
    return true;
  }

  if (args.verbose) {
    std::cerr << "Loading configuration: " << config_path->string() << "\n";
  }

  auto config_result = swlint::load_lint_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return false;
  }
  config = std::move(config_result.config);
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_lint(const CommandArgs & args)
{
  swlint::LintConfig config;
  if (!resolve_config(args, config)) {
    return k_exit_failure;
  }

  const std::string reporter_name = args.reporter.empty() ? config.reporter : args.reporter;
  const auto reporter = swlint::parse_reporter_kind(reporter_name);
  if (!reporter) {
    std::cerr << "error: unknown reporter: " << reporter_name << "\n";
    return k_exit_failure;
  }

  swlint::LintOptions options;
  options.mode = swlint::LintMode::Lint;
  options.verbose = args.verbose;
  for (const auto & input : args.inputs) {
    options.paths.emplace_back(input);
  }

  const auto result = swlint::Linter::run(config, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.sources, args.verbose);
  }

  const bool use_color = isatty(fileno(stdout)) != 0;
  swlint::report_violations(std::cout, *reporter, result, use_color);

  if (result.io_error) {
    return k_exit_failure;
  }
  if (result.error_violation_count() > 0 || (args.strict && result.violation_count() > 0)) {
    return k_exit_violations;
  }
  return k_exit_ok;
}

int cmd_correct(const CommandArgs & args)
{
  swlint::LintConfig config;
  if (!resolve_config(args, config)) {
    return k_exit_failure;
  }

  swlint::LintOptions options;
  options.mode = swlint::LintMode::Correct;
  options.verbose = args.verbose;
  for (const auto & input : args.inputs) {
    options.paths.emplace_back(input);
  }

  const auto result = swlint::Linter::run(config, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.sources, args.verbose);
  }

  swlint::report_corrections(std::cout, result);

  if (args.verbose) {
    std::cerr << "Done correcting " << result.files.size() << " file(s)!\n";
  }

  return result.io_error ? k_exit_failure : k_exit_ok;
}

int cmd_rules(const CommandArgs & args)
{
  const auto & description = swlint::lint::NonOverridableClassDeclarationRule::description();

  swlint::LintConfig config;
  if (!resolve_config(args, config)) {
    return k_exit_failure;
  }

  if (!args.inputs.empty() && args.inputs.front() != description.identifier) {
    std::cerr << "error: unknown rule: " << args.inputs.front() << "\n";
    return k_exit_failure;
  }

  const bool enabled = config.is_rule_enabled(description.identifier, description.opt_in);

  std::cout << description.identifier << " (" << description.name << ")\n"
            << "  kind:          " << swlint::lint::to_string(description.kind) << "\n"
            << "  opt-in:        " << (description.opt_in ? "yes" : "no") << "\n"
            << "  correctable:   yes\n"
            << "  enabled:       " << (enabled ? "yes" : "no") << "\n"
            << "  configuration: " << config.non_overridable_class_declaration.describe() << "\n";

  if (args.inputs.empty()) {
    return k_exit_ok;
  }

  std::cout << "\n" << description.description << "\n";

  std::cout << "\nNon Triggering Examples:\n";
  for (const auto & example : description.non_triggering_examples) {
    std::cout << "\n" << example.code << "\n";
  }
  std::cout << "\nTriggering Examples:\n";
  for (const auto & example : description.triggering_examples) {
    std::cout << "\n" << example.code << "\n";
  }
  return k_exit_ok;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    std::cerr << "error: exactly one input file required\n";
    std::cerr << "usage: swlint dump-ast <file.swift>\n";
    return k_exit_failure;
  }

  const fs::path input_path = fs::absolute(args.inputs.front());

  std::ifstream file(input_path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return k_exit_failure;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  swlint::SourceRegistry sources;
  swlint::AstContext ast;
  swlint::DiagnosticBag diags;
  const auto parsed = swlint::parse_source(sources, input_path, buffer.str(), ast, diags);

  if (!diags.empty()) {
    print_diagnostics(diags, sources, true);
  }

  std::cout << swlint::to_json(parsed.unit).dump(2) << "\n";
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_failure;
  }

  if (args.command == "lint") {
    return cmd_lint(args);
  }
  if (args.command == "correct" || args.command == "autocorrect") {
    return cmd_correct(args);
  }
  if (args.command == "rules") {
    return cmd_rules(args);
  }
  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  std::cerr << "error: unknown command: " << args.command << "\n";
  print_usage(argv[0]);
  return k_exit_failure;
}
