#pragma once

#include <cstdint>
#include <string_view>

#include "swlint/basic/source_manager.hpp"

namespace swlint::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Comments are emitted so tools (directive scanning) can read them; the
  // parser drops them.
  DocLine,       // /// ...
  LineComment,   // // ...
  BlockComment,  // /* ... */ (nesting allowed)

  Identifier,  // includes keywords; backticked identifiers keep their backticks
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.text is the whole literal including delimiters

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Dot,
  At,
  Hash,
  Backslash,

  Arrow,     // ->
  Eq,        // =
  Operator,  // any other run of operator characters
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;  // byte range, trivia excluded
  std::string_view text;
  bool newlineBefore = false;  // a line break separates this token from the previous one

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }

  [[nodiscard]] bool is_comment() const noexcept
  {
    return kind == TokenKind::DocLine || kind == TokenKind::LineComment ||
           kind == TokenKind::BlockComment;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::DocLine:
      return "<doc_line>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::At:
      return "@";
    case TokenKind::Hash:
      return "#";
    case TokenKind::Backslash:
      return "\\";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Operator:
      return "operator";
  }
  return "";
}

}  // namespace swlint::syntax
