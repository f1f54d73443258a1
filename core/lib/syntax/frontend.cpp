// swlint/syntax/frontend.cpp - High-level parse pipeline
#include "swlint/syntax/frontend.hpp"

#include <utility>

#include "swlint/syntax/lexer.hpp"
#include "swlint/syntax/parser.hpp"

namespace swlint
{

SourceUnit * parse_file(
  const SourceFile & file, FileId file_id, AstContext & ast, DiagnosticBag & diags)
{
  syntax::Lexer lexer(file_id, file.content());
  syntax::Parser parser(ast, file_id, file, diags, lexer.lex_all());
  return parser.parse_source_unit();
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;

  // Re-registering a path keeps its id; refresh the contents in that case.
  if (const auto existing = sources.find_by_path(path)) {
    out.file_id = *existing;
    sources.update_content(out.file_id, std::move(source_text));
  } else {
    out.file_id = sources.register_file(path, std::move(source_text));
  }

  if (!out.file_id.is_valid()) {
    diags.report_error({}, "too many source files registered");
    out.unit = ast.create<SourceUnit>();
    return out;
  }

  out.unit = parse_file(*sources.get_file(out.file_id), out.file_id, ast, diags);
  return out;
}

}  // namespace swlint
