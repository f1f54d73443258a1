// swlint/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "swlint/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace swlint
{

namespace
{

/// Expand tabs to four spaces and drop line terminators.
std::string clean_line(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

std::string display_path(const std::filesystem::path & path)
{
  if (path.empty()) {
    return "<unknown>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(path, std::filesystem::current_path(), ec);
  if (ec || rel.empty()) {
    return path.string();
  }
  return rel.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const std::string filename = display_path(sources.get_path(primary_range.file_id()));
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    const SourceRange ra = a->primary_range();
    const SourceRange rb = b->primary_range();
    if (ra.file_id() != rb.file_id()) {
      return ra.file_id().value < rb.file_id().value;
    }
    return ra.get_begin() < rb.get_begin();
  });

  for (const auto * d : sorted) {
    print(*d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);

  if (!use_color_) {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << severity_str;
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * source = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (source == nullptr || !fr.is_valid()) {
    return;
  }

  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    source->get_line(fr.start_line - 1), fr.start_line, fr.start_column, end_col, label.style,
    label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  if (line.empty()) {
    return;
  }

  fmt::print(os_, " {:>4} | {}\n", line_num, clean_line(line));

  // Marker prefix mirrors tab expansion in clean_line.
  std::string marker_prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  if (use_color_) {
    os_ << ((style == LabelStyle::Primary) ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceRegistry & sources)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  print_help(fmt::format("replace with '{}'", fixit.replacement_text));

  const SourceFile * source = sources.get_file(fixit.range.file_id());
  const FullSourceRange fr = sources.get_full_range(fixit.range);
  if (source == nullptr || !fr.is_valid() || fr.start_line != fr.end_line) {
    return;
  }

  const std::string_view line = source->get_line(fr.start_line - 1);
  const size_t start = fr.start_column - 1;
  const size_t len = fr.end_column - fr.start_column;
  if (start + len > line.size()) {
    return;
  }

  std::string fixed(line);
  fixed.replace(start, len, fixit.replacement_text);
  fmt::print(os_, " {:>4} | {}\n", fr.start_line, clean_line(fixed));
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace swlint
