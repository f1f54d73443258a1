// swlint/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "swlint/ast/ast.hpp"
#include "swlint/ast/ast_context.hpp"
#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  SourceUnit * unit = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

/// Parse a file that is already registered. Never returns null.
[[nodiscard]] SourceUnit * parse_file(
  const SourceFile & file, FileId file_id, AstContext & ast, DiagnosticBag & diags);

}  // namespace swlint
