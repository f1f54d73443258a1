// swlint/lint/violation.hpp - Violation, edit and correction records
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint::lint
{

/// User-facing position: 1-based line and character (code point) column.
struct Location
{
  std::filesystem::path file;
  uint32_t line = 0;
  uint32_t character = 0;

  [[nodiscard]] bool is_valid() const noexcept { return line > 0; }
};

[[nodiscard]] Location make_location(const SourceFile & file, uint32_t offset);

/// One reported violation. Immutable once created.
struct StyleViolation
{
  std::string rule_id;
  Severity severity = Severity::Warning;
  SourceLocation position;  ///< start of the offending token
  std::string reason;

  /// What makes the modifier redundant, shown as a secondary label.
  SourceRange cause;
  std::string cause_note;
};

/// Text to replace: exactly one modifier token, trivia excluded.
struct CorrectionEdit
{
  SourceRange range;
};

/// One applied edit, reported at its position in the original contents.
struct Correction
{
  std::string rule_id;
  std::string rule_name;
  Location location;
  uint32_t offset = 0;
};

}  // namespace swlint::lint
