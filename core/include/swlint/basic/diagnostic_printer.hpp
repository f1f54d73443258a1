// swlint/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[non_overridable_class_declaration]: Class methods in final classes should ...
 *     --> Sources/C.swift:2:5
 *      |
 *    2 |     class func f() {}
 *      |     ^^^^^
 *      |
 *      = help: replace with 'final class'
 *    2 |     final class func f() {}
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics ordered by file and position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace swlint
