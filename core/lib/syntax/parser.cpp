#include "swlint/syntax/parser.hpp"

#include <algorithm>
#include <string>

#include "swlint/syntax/keywords.hpp"

namespace swlint::syntax
{
namespace
{

[[nodiscard]] bool is_access_modifier(std::string_view w) noexcept
{
  return w == "private" || w == "fileprivate" || w == "internal" || w == "public" ||
         w == "package" || w == "open";
}

[[nodiscard]] AccessorKind accessor_kind_of(std::string_view w) noexcept
{
  if (w == "get") return AccessorKind::Get;
  if (w == "set") return AccessorKind::Set;
  if (w == "willSet") return AccessorKind::WillSet;
  if (w == "didSet") return AccessorKind::DidSet;
  if (w == "_read") return AccessorKind::Read;
  if (w == "_modify" || w == "modify") return AccessorKind::Modify;
  if (w == "init") return AccessorKind::Init;
  return AccessorKind::Other;
}

[[nodiscard]] std::string unknown_token_message(std::string_view text)
{
  if (text.substr(0, 2) == "/*") {
    return "unterminated '/*' comment";
  }
  if (!text.empty() && (text.front() == '"' || text.front() == '#')) {
    return "unterminated string literal";
  }
  if (!text.empty() && text.front() == '`') {
    return "unterminated escaped identifier";
  }
  return "invalid character in source file";
}

/// Net change of generic angle depth contributed by an operator token.
[[nodiscard]] int angle_delta(const Token & t) noexcept
{
  if (t.kind != TokenKind::Operator) return 0;
  const auto opens = std::count(t.text.begin(), t.text.end(), '<');
  const auto closes = std::count(t.text.begin(), t.text.end(), '>');
  return static_cast<int>(opens - closes);
}

}  // namespace

Parser::Parser(
  AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
  std::vector<Token> tokens)
: ast_(ast), file_id_(file_id), source_(source), diags_(diags)
{
  tokens_.reserve(tokens.size());

  // A comment spanning a line break still separates the tokens around it.
  bool carry_newline = false;
  for (Token & t : tokens) {
    if (t.is_comment()) {
      carry_newline = carry_newline || t.newlineBefore ||
                      (t.kind == TokenKind::BlockComment &&
                       t.text.find('\n') != std::string_view::npos);
      continue;
    }
    if (carry_newline) {
      t.newlineBefore = true;
      carry_newline = false;
    }
    if (t.kind == TokenKind::Unknown) {
      error_at(t, unknown_token_message(t.text));
    }
    tokens_.push_back(t);
  }

  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    const auto end = static_cast<uint32_t>(source_.size());
    eof.range = SourceRange(file_id_, end, end);
    eof.newlineBefore = true;
    tokens_.push_back(eof);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const { return tok_at(idx_ + lookahead); }

const Token & Parser::tok_at(size_t index) const
{
  if (index >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[index];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw) const { return is_kw(kw, cur()); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg)).with_code("syntax");
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

uint32_t Parser::prev_end() const { return idx_ > 0 ? tokens_[idx_ - 1].end() : 0; }

SourceRange Parser::range_from(uint32_t begin) const
{
  return SourceRange(file_id_, begin, std::max(begin, prev_end()));
}

void Parser::synchronize_to_member()
{
  // Always make progress.
  if (at(TokenKind::LBrace) || at(TokenKind::LParen) || at(TokenKind::LBracket)) {
    idx_ = skip_balanced_at(idx_);
  } else {
    advance();
  }

  while (!at_eof()) {
    if (at(TokenKind::RBrace)) {
      return;
    }
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (cur().newlineBefore && (at(TokenKind::Hash) || at_decl_start(DeclContext::Members))) {
      return;
    }
    if (at(TokenKind::LBrace) || at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
      continue;
    }
    advance();
  }
}

// ============================================================================
// Lookahead scanners
// ============================================================================

size_t Parser::skip_balanced_at(size_t index) const
{
  int depth = 0;
  for (size_t i = index; i < tokens_.size(); ++i) {
    switch (tokens_[i].kind) {
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace:
        ++depth;
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace:
        --depth;
        if (depth <= 0) {
          return i + 1;
        }
        break;
      case TokenKind::Eof:
        return i;
      default:
        break;
    }
  }
  return tokens_.size() - 1;
}

size_t Parser::skip_attribute_at(size_t index) const
{
  // '@' Name ('.' Name)* ('<' ... '>')? ('(' ... ')')?
  size_t i = index + 1;
  if (tok_at(i).kind != TokenKind::Identifier) {
    return i;
  }
  ++i;
  while (tok_at(i).kind == TokenKind::Dot && tok_at(i + 1).kind == TokenKind::Identifier) {
    i += 2;
  }
  if (tok_at(i).kind == TokenKind::Operator && tok_at(i).text.front() == '<') {
    int depth = 0;
    do {
      depth += angle_delta(tok_at(i));
      ++i;
    } while (depth > 0 && tok_at(i).kind != TokenKind::Eof);
  }
  if (tok_at(i).kind == TokenKind::LParen && !tok_at(i).newlineBefore) {
    i = skip_balanced_at(i);
  }
  return i;
}

size_t Parser::modifier_end_at(size_t index) const
{
  const Token & t = tok_at(index);
  if (t.kind != TokenKind::Identifier || !contains(k_decl_modifiers, t.text)) {
    return index;
  }

  if (t.text == "class") {
    // `class` is a modifier only in front of another modifier or a member keyword.
    const Token & next = tok_at(index + 1);
    const bool before_member =
      next.kind == TokenKind::Identifier && contains(k_class_member_keywords, next.text);
    if (!before_member && modifier_end_at(index + 1) == index + 1) {
      return index;
    }
    return index + 1;
  }

  // private(set), unowned(safe)
  if (
    (is_access_modifier(t.text) || t.text == "unowned") &&
    tok_at(index + 1).kind == TokenKind::LParen &&
    tok_at(index + 2).kind == TokenKind::Identifier &&
    tok_at(index + 3).kind == TokenKind::RParen) {
    const std::string_view detail = tok_at(index + 2).text;
    if (detail == "set" || detail == "safe" || detail == "unsafe") {
      return index + 4;
    }
    return index;
  }

  return index + 1;
}

size_t Parser::scan_decl_prefix(size_t index) const
{
  size_t i = index;
  while (true) {
    if (tok_at(i).kind == TokenKind::At) {
      i = skip_attribute_at(i);
      continue;
    }
    const size_t end = modifier_end_at(i);
    if (end == i) {
      return i;
    }
    i = end;
  }
}

bool Parser::is_decl_keyword_at(size_t index, DeclContext ctx) const
{
  const Token & t = tok_at(index);
  if (t.kind != TokenKind::Identifier || !contains(k_decl_keywords, t.text)) {
    // `actor` is contextual and not in the keyword table.
    if (is_kw("actor", t)) {
      const Token & next = tok_at(index + 1);
      return next.kind == TokenKind::Identifier && !next.newlineBefore;
    }
    return false;
  }

  const std::string_view w = t.text;
  if (w == "class") {
    return tok_at(index + 1).kind == TokenKind::Identifier;
  }
  if (w == "init" || w == "deinit" || w == "subscript" || w == "case") {
    return ctx == DeclContext::Members;
  }
  if (w == "associatedtype") {
    return ctx == DeclContext::Members;
  }
  if (w == "import" || w == "operator" || w == "precedencegroup") {
    return ctx == DeclContext::TopLevel;
  }
  return true;
}

bool Parser::at_decl_start(DeclContext ctx) const
{
  return is_decl_keyword_at(scan_decl_prefix(idx_), ctx);
}

bool Parser::at_statement_start() const
{
  if (idx_ == 0 || cur().newlineBefore) {
    return true;
  }
  const TokenKind prev = tokens_[idx_ - 1].kind;
  return prev == TokenKind::Semicolon || prev == TokenKind::LBrace || prev == TokenKind::RBrace;
}

bool Parser::looks_like_accessor_block() const
{
  if (!at(TokenKind::LBrace)) {
    return false;
  }

  size_t i = idx_ + 1;
  while (true) {
    if (tok_at(i).kind == TokenKind::At) {
      i = skip_attribute_at(i);
      continue;
    }
    const size_t end = modifier_end_at(i);
    if (end == i) break;
    i = end;
  }

  const Token & t = tok_at(i);
  if (t.kind != TokenKind::Identifier || !contains(k_accessor_keywords, t.text)) {
    return false;
  }

  const Token & next = tok_at(i + 1);
  switch (next.kind) {
    case TokenKind::LBrace:
    case TokenKind::RBrace:
    case TokenKind::LParen:
    case TokenKind::Semicolon:
      return true;
    case TokenKind::Identifier:
      return contains(k_accessor_keywords, next.text) || contains(k_accessor_effects, next.text);
    default:
      return false;
  }
}

// ============================================================================
// Top level
// ============================================================================

SourceUnit * Parser::parse_source_unit()
{
  std::vector<AstNode *> items;

  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      items.push_back(parse_code_block());
      continue;
    }
    if (at(TokenKind::RBrace)) {
      error_at(cur(), "extraneous '}' at top level");
      advance();
      continue;
    }
    if (skip_compiler_directive()) {
      continue;
    }
    if (at_statement_start() && at_decl_start(DeclContext::TopLevel)) {
      const size_t before = idx_;
      if (Decl * d = parse_decl(DeclContext::TopLevel)) {
        items.push_back(d);
      }
      if (idx_ == before) advance();
      continue;
    }
    // Top-level statement tokens are not modeled.
    advance();
  }

  auto * unit =
    ast_.create<SourceUnit>(SourceRange(file_id_, 0, static_cast<uint32_t>(source_.size())));
  unit->items = ast_.copy_to_arena(items);
  return unit;
}

bool Parser::skip_compiler_directive()
{
  if (!at(TokenKind::Hash) || cur(1).kind != TokenKind::Identifier) {
    return false;
  }

  const std::string_view directive = cur(1).text;
  if (directive == "if" || directive == "elseif") {
    advance();
    advance();
    skip_to_line_end();
    return true;
  }
  if (directive == "else" || directive == "endif") {
    advance();
    advance();
    return true;
  }
  if (directive == "warning" || directive == "error" || directive == "sourceLocation") {
    advance();
    advance();
    if (at(TokenKind::LParen)) {
      idx_ = skip_balanced_at(idx_);
    }
    return true;
  }
  return false;
}

void Parser::skip_to_line_end()
{
  while (!at_eof() && !cur().newlineBefore && !at(TokenKind::RBrace) &&
         !at(TokenKind::Semicolon)) {
    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
      continue;
    }
    advance();
  }
}

// ============================================================================
// Declarations
// ============================================================================

Decl * Parser::parse_decl(DeclContext ctx)
{
  const uint32_t begin = cur().begin();

  std::vector<Attribute *> attributes;
  std::vector<DeclModifier *> modifiers;
  while (true) {
    if (at(TokenKind::At)) {
      attributes.push_back(parse_attribute());
      continue;
    }
    if (modifier_end_at(idx_) != idx_) {
      modifiers.push_back(parse_modifier());
      continue;
    }
    break;
  }

  Decl * decl = nullptr;
  const std::string_view kw = cur().text;

  if (!is_decl_keyword_at(idx_, ctx)) {
    error_at(cur(), "expected declaration");
    return nullptr;
  }

  if (
    kw == "class" || kw == "struct" || kw == "enum" || kw == "actor" || kw == "extension" ||
    kw == "protocol") {
    decl = parse_type_decl(begin);
  } else if (kw == "func") {
    decl = parse_function_decl(begin);
  } else if (kw == "init") {
    decl = parse_initializer_decl(begin);
  } else if (kw == "deinit") {
    decl = parse_deinitializer_decl(begin);
  } else if (kw == "subscript") {
    decl = parse_subscript_decl(begin);
  } else if (kw == "var" || kw == "let") {
    decl = parse_variable_decl(begin);
  } else if (kw == "typealias" || kw == "associatedtype") {
    decl = parse_type_alias_decl(begin);
  } else if (kw == "case") {
    decl = parse_enum_case_decl(begin);
  } else if (kw == "import") {
    decl = parse_import_decl(begin);
  } else {
    skip_operator_decl();
    return nullptr;
  }

  decl->attributes = ast_.copy_to_arena(attributes);
  decl->modifiers = ast_.copy_to_arena(modifiers);
  return decl;
}

Attribute * Parser::parse_attribute()
{
  const Token & at_tok = cur();
  const uint32_t begin = at_tok.begin();
  const size_t end = skip_attribute_at(idx_);

  std::string_view name;
  if (cur(1).kind == TokenKind::Identifier) {
    name = ast_.intern(cur(1).text);
  } else {
    error_at(at_tok, "expected an attribute name");
  }

  idx_ = end;
  return ast_.create<Attribute>(name, range_from(begin));
}

DeclModifier * Parser::parse_modifier()
{
  const size_t end = modifier_end_at(idx_);
  const Token & name_tok = cur();

  auto * mod = ast_.create<DeclModifier>(ast_.intern(name_tok.text), name_tok.range);
  if (end - idx_ == 4) {
    mod->detail = ast_.intern(cur(2).text);
    mod->fullRange = SourceRange(file_id_, name_tok.begin(), cur(3).end());
  }

  idx_ = end;
  return mod;
}

TypeDecl * Parser::parse_type_decl(uint32_t begin)
{
  const Token & kw = advance();
  const std::string_view keyword = kw.text;

  std::string_view name;
  SourceRange name_range;

  if (keyword == "extension") {
    // The extended type runs up to the inheritance clause, where clause or body.
    const uint32_t name_begin = cur().begin();
    while (!at_eof() && !at(TokenKind::LBrace) && !at(TokenKind::RBrace) &&
           !at(TokenKind::Colon) && !at_kw("where")) {
      if (cur().newlineBefore && prev_end() > name_begin) break;
      advance();
    }
    if (prev_end() > name_begin) {
      name_range = SourceRange(file_id_, name_begin, prev_end());
      name = ast_.intern(source_.get_slice(name_range));
    } else {
      error_at(cur(), "expected type name in extension declaration");
    }
  } else if (at(TokenKind::Identifier)) {
    name = ast_.intern(cur().text);
    name_range = cur().range;
    advance();
  } else {
    error_at(cur(), std::string("expected identifier in ") + std::string(keyword) + " declaration");
  }

  // Generic parameters, inheritance clause and where clause.
  while (!at_eof() && !at(TokenKind::LBrace)) {
    if (at(TokenKind::RBrace) || (cur().newlineBefore && at_decl_start(DeclContext::Members))) {
      break;
    }
    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
      continue;
    }
    advance();
  }

  std::vector<Decl *> members;
  if (at(TokenKind::LBrace)) {
    members = parse_member_block(keyword);
  } else {
    error_at(cur(), std::string("expected '{' in ") + std::string(keyword));
  }

  const SourceRange range = range_from(begin);
  TypeDecl * decl = nullptr;
  if (keyword == "class") {
    decl = ast_.create<ClassDecl>(range);
  } else if (keyword == "struct") {
    decl = ast_.create<StructDecl>(range);
  } else if (keyword == "enum") {
    decl = ast_.create<EnumDecl>(range);
  } else if (keyword == "actor") {
    decl = ast_.create<ActorDecl>(range);
  } else if (keyword == "extension") {
    decl = ast_.create<ExtensionDecl>(range);
  } else {
    decl = ast_.create<ProtocolDecl>(range);
  }

  decl->name = name;
  decl->nameRange = name_range;
  decl->members = ast_.copy_to_arena(members);
  return decl;
}

std::vector<Decl *> Parser::parse_member_block(std::string_view owner)
{
  std::vector<Decl *> members;
  advance();  // {

  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    if (skip_compiler_directive()) {
      continue;
    }
    if (at_decl_start(DeclContext::Members)) {
      const size_t before = idx_;
      if (Decl * d = parse_decl(DeclContext::Members)) {
        members.push_back(d);
      }
      if (idx_ == before) advance();
      continue;
    }

    error_at(cur(), std::string("expected declaration in ") + std::string(owner) + " body");
    synchronize_to_member();
  }

  expect(TokenKind::RBrace, std::string("'}' at end of ") + std::string(owner) + " body");
  return members;
}

void Parser::skip_signature()
{
  // Generic clause, parameters, effects, result type, where clause.
  while (!at_eof() && !at(TokenKind::LBrace)) {
    if (at(TokenKind::RBrace) || at(TokenKind::Semicolon)) {
      return;
    }
    if (
      cur().newlineBefore && (at(TokenKind::Hash) || at_decl_start(DeclContext::Members) ||
                              at_decl_start(DeclContext::TopLevel))) {
      return;
    }
    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
      continue;
    }
    advance();
  }
}

FunctionDecl * Parser::parse_function_decl(uint32_t begin)
{
  advance();  // func

  std::string_view name;
  SourceRange name_range;
  if (at(TokenKind::Identifier) || at(TokenKind::Operator) || at(TokenKind::Eq)) {
    name = ast_.intern(cur().text);
    name_range = cur().range;
    advance();
  } else {
    error_at(cur(), "expected identifier in function declaration");
  }

  skip_signature();
  CodeBlock * body = at(TokenKind::LBrace) ? parse_code_block() : nullptr;

  auto * fn = ast_.create<FunctionDecl>(name, range_from(begin));
  fn->nameRange = name_range;
  fn->body = body;
  return fn;
}

InitializerDecl * Parser::parse_initializer_decl(uint32_t begin)
{
  advance();  // init
  if (at(TokenKind::Operator) && (cur().text == "?" || cur().text == "!")) {
    advance();
  }

  skip_signature();
  CodeBlock * body = at(TokenKind::LBrace) ? parse_code_block() : nullptr;

  auto * init = ast_.create<InitializerDecl>(range_from(begin));
  init->body = body;
  return init;
}

DeinitializerDecl * Parser::parse_deinitializer_decl(uint32_t begin)
{
  advance();  // deinit
  CodeBlock * body = at(TokenKind::LBrace) ? parse_code_block() : nullptr;

  auto * deinit = ast_.create<DeinitializerDecl>(range_from(begin));
  deinit->body = body;
  return deinit;
}

SubscriptDecl * Parser::parse_subscript_decl(uint32_t begin)
{
  advance();  // subscript
  skip_signature();

  std::vector<AccessorDecl *> accessors;
  if (at(TokenKind::LBrace)) {
    accessors = parse_accessor_block();
  } else {
    error_at(cur(), "expected '{' in subscript to specify getter and setter implementation");
  }

  auto * sub = ast_.create<SubscriptDecl>(range_from(begin));
  sub->accessors = ast_.copy_to_arena(accessors);
  return sub;
}

void Parser::skip_type_annotation()
{
  int angle = 0;
  while (!at_eof()) {
    if (angle == 0) {
      if (
        at(TokenKind::Eq) || at(TokenKind::LBrace) || at(TokenKind::RBrace) ||
        at(TokenKind::Comma) || at(TokenKind::Semicolon) || cur().newlineBefore) {
        return;
      }
    } else if (at(TokenKind::RBrace) || at(TokenKind::LBrace)) {
      return;
    }

    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
      continue;
    }
    angle = std::max(0, angle + angle_delta(cur()));
    advance();
  }
}

void Parser::skip_initializer_expr(std::vector<CodeBlock *> & closures)
{
  int depth = 0;  // parentheses and brackets
  while (!at_eof()) {
    if (at(TokenKind::RBrace)) {
      return;
    }
    if (depth == 0) {
      if (at(TokenKind::Comma) || at(TokenKind::Semicolon)) {
        return;
      }
      if (
        cur().newlineBefore && (at(TokenKind::Hash) || at_decl_start(DeclContext::Members) ||
                                at_decl_start(DeclContext::Statements))) {
        return;
      }
      if (looks_like_accessor_block()) {
        return;  // property observers after the initial value
      }
    }

    if (at(TokenKind::LBrace)) {
      closures.push_back(parse_code_block());
      continue;
    }
    if (at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      ++depth;
    } else if (at(TokenKind::RParen) || at(TokenKind::RBracket)) {
      if (depth == 0) {
        return;
      }
      --depth;
    }
    advance();
  }
}

VariableDecl * Parser::parse_variable_decl(uint32_t begin)
{
  const bool is_let = advance().text == "let";

  std::vector<std::string_view> names;
  std::vector<CodeBlock *> closures;
  std::vector<AccessorDecl *> accessors;

  while (!at_eof()) {
    if (at(TokenKind::Identifier)) {
      names.push_back(ast_.intern(cur().text));
      advance();
    } else if (at(TokenKind::LParen)) {
      // Tuple pattern: bind every identifier inside.
      const size_t end = skip_balanced_at(idx_);
      for (size_t i = idx_ + 1; i + 1 < end; ++i) {
        if (tokens_[i].kind == TokenKind::Identifier) {
          names.push_back(ast_.intern(tokens_[i].text));
        }
      }
      idx_ = end;
    } else {
      error_at(cur(), "expected pattern in variable declaration");
      break;
    }

    if (match(TokenKind::Colon)) {
      skip_type_annotation();
    }
    if (match(TokenKind::Eq)) {
      skip_initializer_expr(closures);
    }
    if (at(TokenKind::LBrace)) {
      accessors = parse_accessor_block();
    }

    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  auto * var = ast_.create<VariableDecl>(is_let, range_from(begin));
  var->names = ast_.copy_to_arena(names);
  var->closures = ast_.copy_to_arena(closures);
  var->accessors = ast_.copy_to_arena(accessors);
  return var;
}

TypeAliasDecl * Parser::parse_type_alias_decl(uint32_t begin)
{
  const Token & kw = advance();

  std::string_view name;
  if (at(TokenKind::Identifier)) {
    name = ast_.intern(cur().text);
    advance();
  } else {
    error_at(cur(), std::string("expected identifier in ") + std::string(kw.text) + " declaration");
  }

  skip_to_line_end();
  return ast_.create<TypeAliasDecl>(name, range_from(begin));
}

EnumCaseDecl * Parser::parse_enum_case_decl(uint32_t begin)
{
  advance();  // case

  std::vector<std::string_view> names;
  while (!at_eof()) {
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "expected identifier in enum 'case' declaration");
      break;
    }
    names.push_back(ast_.intern(cur().text));
    advance();

    if (at(TokenKind::LParen)) {
      idx_ = skip_balanced_at(idx_);  // associated values
    }
    if (match(TokenKind::Eq)) {
      // Raw value
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RBrace) &&
             !at(TokenKind::Semicolon) && !cur().newlineBefore) {
        advance();
      }
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  auto * decl = ast_.create<EnumCaseDecl>(range_from(begin));
  decl->names = ast_.copy_to_arena(names);
  return decl;
}

ImportDecl * Parser::parse_import_decl(uint32_t begin)
{
  advance();  // import

  // import kind, e.g. `import class Foo.Bar`
  if (
    at(TokenKind::Identifier) && cur(1).kind == TokenKind::Identifier && !cur(1).newlineBefore &&
    contains(k_decl_keywords, cur().text)) {
    advance();
  }

  const uint32_t path_begin = cur().begin();
  while (!at_eof() && !cur().newlineBefore &&
         (at(TokenKind::Identifier) || at(TokenKind::Dot))) {
    advance();
  }

  std::string_view path;
  if (prev_end() > path_begin) {
    path = ast_.intern(source_.get_slice(SourceRange(file_id_, path_begin, prev_end())));
  } else {
    error_at(cur(), "expected module name in import declaration");
  }
  return ast_.create<ImportDecl>(path, range_from(begin));
}

void Parser::skip_operator_decl()
{
  const Token & kw = advance();
  if (kw.text == "precedencegroup") {
    if (at(TokenKind::Identifier)) advance();
    if (at(TokenKind::LBrace)) {
      idx_ = skip_balanced_at(idx_);
    } else {
      error_at(cur(), "expected '{' after precedence group name");
    }
    return;
  }
  skip_to_line_end();
}

// ============================================================================
// Bodies
// ============================================================================

CodeBlock * Parser::parse_code_block()
{
  const uint32_t begin = cur().begin();
  advance();  // {

  std::vector<AstNode *> items;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (at(TokenKind::LBrace)) {
      items.push_back(parse_code_block());
      continue;
    }
    if (at_statement_start() && at_decl_start(DeclContext::Statements)) {
      const size_t before = idx_;
      if (Decl * d = parse_decl(DeclContext::Statements)) {
        items.push_back(d);
      }
      if (idx_ == before) advance();
      continue;
    }
    advance();
  }

  expect(TokenKind::RBrace, "'}' at end of block");

  auto * block = ast_.create<CodeBlock>(range_from(begin));
  block->items = ast_.copy_to_arena(items);
  return block;
}

std::vector<AccessorDecl *> Parser::parse_accessor_block()
{
  if (!looks_like_accessor_block()) {
    // `var x: T { expr }` is a getter without the `get` keyword.
    CodeBlock * body = parse_code_block();
    auto * getter = ast_.create<AccessorDecl>(AccessorKind::Get, body->get_range());
    getter->body = body;
    getter->isImplicit = true;
    return {getter};
  }

  std::vector<AccessorDecl *> accessors;
  advance();  // {

  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    if (skip_compiler_directive()) {
      continue;
    }
    if (AccessorDecl * accessor = parse_accessor()) {
      accessors.push_back(accessor);
    }
  }

  expect(TokenKind::RBrace, "'}' at end of accessor block");
  return accessors;
}

AccessorDecl * Parser::parse_accessor()
{
  const uint32_t begin = cur().begin();

  std::vector<DeclModifier *> modifiers;
  while (true) {
    if (at(TokenKind::At)) {
      (void)parse_attribute();
      continue;
    }
    if (modifier_end_at(idx_) != idx_) {
      modifiers.push_back(parse_modifier());
      continue;
    }
    break;
  }

  if (!at(TokenKind::Identifier) || !contains(k_accessor_keywords, cur().text)) {
    error_at(cur(), "expected 'get', 'set', 'willSet' or 'didSet' accessor");
    if (at(TokenKind::LBrace) || at(TokenKind::LParen) || at(TokenKind::LBracket)) {
      idx_ = skip_balanced_at(idx_);
    } else if (!at(TokenKind::RBrace)) {
      advance();
    }
    return nullptr;
  }

  const AccessorKind kind = accessor_kind_of(advance().text);

  if (at(TokenKind::LParen)) {
    idx_ = skip_balanced_at(idx_);  // setter parameter name
  }
  while (at(TokenKind::Identifier) && contains(k_accessor_effects, cur().text)) {
    advance();
    if (at(TokenKind::LParen)) {
      idx_ = skip_balanced_at(idx_);  // typed throws
    }
  }

  CodeBlock * body = at(TokenKind::LBrace) ? parse_code_block() : nullptr;

  auto * accessor = ast_.create<AccessorDecl>(kind, range_from(begin));
  accessor->modifiers = ast_.copy_to_arena(modifiers);
  accessor->body = body;
  return accessor;
}

}  // namespace swlint::syntax
