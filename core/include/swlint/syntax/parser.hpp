#pragma once

#include <string_view>
#include <vector>

#include "swlint/ast/ast.hpp"
#include "swlint/ast/ast_context.hpp"
#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/source_manager.hpp"
#include "swlint/syntax/token.hpp"

namespace swlint::syntax
{

/// Where a declaration is being parsed; decides which keywords start one.
enum class DeclContext : uint8_t {
  TopLevel,    // file scope: imports allowed, statements skipped
  Members,     // type body: enum cases, initializers and subscripts allowed
  Statements,  // function or closure body: only local declarations
};

/**
 * Recursive-descent parser producing the declaration-level AST.
 *
 * Statements and expressions are skipped token by token; braces found inside
 * them become CodeBlock nodes so declarations nested in closures and local
 * scopes stay reachable. Syntax errors are reported to the DiagnosticBag and
 * parsing always runs to the end of the file.
 */
class Parser
{
public:
  /// Comment tokens are dropped; unterminated literals are reported here.
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens);

  [[nodiscard]] SourceUnit * parse_source_unit();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & tok_at(size_t index) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw) const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_member();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] uint32_t prev_end() const;
  [[nodiscard]] SourceRange range_from(uint32_t begin) const;

  // Lookahead scanners (token indices, nothing consumed)
  [[nodiscard]] size_t skip_balanced_at(size_t index) const;
  [[nodiscard]] size_t skip_attribute_at(size_t index) const;
  [[nodiscard]] size_t modifier_end_at(size_t index) const;
  [[nodiscard]] size_t scan_decl_prefix(size_t index) const;
  [[nodiscard]] bool is_decl_keyword_at(size_t index, DeclContext ctx) const;
  [[nodiscard]] bool at_decl_start(DeclContext ctx) const;
  [[nodiscard]] bool at_statement_start() const;
  [[nodiscard]] bool looks_like_accessor_block() const;

  // Declarations
  [[nodiscard]] Decl * parse_decl(DeclContext ctx);
  [[nodiscard]] Attribute * parse_attribute();
  [[nodiscard]] DeclModifier * parse_modifier();

  [[nodiscard]] TypeDecl * parse_type_decl(uint32_t begin);
  [[nodiscard]] FunctionDecl * parse_function_decl(uint32_t begin);
  [[nodiscard]] InitializerDecl * parse_initializer_decl(uint32_t begin);
  [[nodiscard]] DeinitializerDecl * parse_deinitializer_decl(uint32_t begin);
  [[nodiscard]] SubscriptDecl * parse_subscript_decl(uint32_t begin);
  [[nodiscard]] VariableDecl * parse_variable_decl(uint32_t begin);
  [[nodiscard]] TypeAliasDecl * parse_type_alias_decl(uint32_t begin);
  [[nodiscard]] EnumCaseDecl * parse_enum_case_decl(uint32_t begin);
  [[nodiscard]] ImportDecl * parse_import_decl(uint32_t begin);
  void skip_operator_decl();

  [[nodiscard]] std::vector<Decl *> parse_member_block(std::string_view owner);
  [[nodiscard]] AccessorDecl * parse_accessor();

  // Bodies
  [[nodiscard]] CodeBlock * parse_code_block();
  [[nodiscard]] std::vector<AccessorDecl *> parse_accessor_block();
  void skip_signature();
  void skip_type_annotation();
  void skip_initializer_expr(std::vector<CodeBlock *> & closures);
  void skip_to_line_end();
  bool skip_compiler_directive();

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace swlint::syntax
