#include "swlint/syntax/lexer.hpp"

#include <cctype>
#include <optional>
#include <string_view>

namespace swlint::syntax
{
namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

bool is_operator_char(char c)
{
  switch (c) {
    case '/':
    case '=':
    case '-':
    case '+':
    case '!':
    case '*':
    case '%':
    case '<':
    case '>':
    case '&':
    case '|':
    case '^':
    case '~':
    case '?':
      return true;
    default:
      return false;
  }
}

/// Count consecutive '#' characters starting at `pos`.
size_t count_hashes(std::string_view src, size_t pos)
{
  size_t n = 0;
  while (pos + n < src.size() && src[pos + n] == '#') {
    ++n;
  }
  return n;
}

/**
 * Scan a string literal that starts at `pos` (at its first '#' or '"').
 *
 * Handles raw delimiters (#"..."#), multi-line literals ("""...""") and
 * interpolation segments, which may themselves contain string literals.
 * Returns the offset one past the closing delimiter, or std::nullopt if the
 * literal is unterminated.
 */
std::optional<size_t> scan_string_literal(std::string_view src, size_t pos)
{
  const size_t hashes = count_hashes(src, pos);
  pos += hashes;
  if (pos >= src.size() || src[pos] != '"') {
    return std::nullopt;
  }

  const bool multiline = src.substr(pos, 3) == "\"\"\"";
  pos += multiline ? 3 : 1;

  const auto closes_here = [&](size_t at) {
    const size_t quote_len = multiline ? 3 : 1;
    if (src.substr(at, quote_len) != (multiline ? std::string_view("\"\"\"") : "\"")) {
      return false;
    }
    return count_hashes(src, at + quote_len) >= hashes;
  };

  while (pos < src.size()) {
    const char c = src[pos];

    if (!multiline && (c == '\n' || c == '\r')) {
      return std::nullopt;
    }

    if (c == '"' && closes_here(pos)) {
      return pos + (multiline ? 3 : 1) + hashes;
    }

    if (c == '\\' && count_hashes(src, pos + 1) >= hashes) {
      pos += 1 + hashes;
      if (pos >= src.size()) {
        return std::nullopt;
      }
      if (src[pos] != '(') {
        ++pos;  // single escaped character
        continue;
      }

      // Interpolation: balance parentheses, skipping nested literals.
      int depth = 1;
      ++pos;
      while (pos < src.size() && depth > 0) {
        const char ic = src[pos];
        if (ic == '"' || (ic == '#' && src[pos + count_hashes(src, pos)] == '"')) {
          const auto nested_end = scan_string_literal(src, pos);
          if (!nested_end) {
            return std::nullopt;
          }
          pos = *nested_end;
          continue;
        }
        if (ic == '(') {
          ++depth;
        } else if (ic == ')') {
          --depth;
        } else if (!multiline && ic == '\n') {
          return std::nullopt;
        }
        ++pos;
      }
      continue;
    }

    ++pos;
  }

  return std::nullopt;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      newline_pending_ = true;
      advance(1);
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(file_id_, start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  const bool is_doc = starts_with("///") && !starts_with("////");
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  Token t = make_token(is_doc ? TokenKind::DocLine : TokenKind::LineComment, start);
  if (!t.text.empty() && t.text.back() == '\r') {
    t.text.remove_suffix(1);
  }
  return t;
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  int depth = 1;
  while (!eof() && depth > 0) {
    if (starts_with("/*")) {
      ++depth;
      advance(2);
    } else if (starts_with("*/")) {
      --depth;
      advance(2);
    } else {
      advance(1);
    }
  }
  // Unterminated comments swallow the rest of the file.
  return make_token(depth == 0 ? TokenKind::BlockComment : TokenKind::Unknown, start);
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_escaped_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && peek() != '`' && peek() != '\n') {
    advance(1);
  }
  if (peek() != '`') {
    return make_token(TokenKind::Unknown, start);
  }
  advance(1);
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  bool is_float = false;

  const auto consume_digits = [this]() {
    while (!eof()) {
      const auto c = static_cast<unsigned char>(peek());
      if (std::isalnum(c) != 0 || c == '_') {
        // Exponent sign: 1e-3, 0x1p+4
        const char lower = static_cast<char>(std::tolower(c));
        const bool is_hex = starts_with("0x") || starts_with("0X");
        advance(1);
        if ((lower == 'e' && !is_hex) || lower == 'p') {
          if (peek() == '+' || peek() == '-') {
            advance(1);
          }
        }
        continue;
      }
      break;
    }
  };

  consume_digits();
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    is_float = true;
    advance(1);
    consume_digits();
  }

  const std::string_view text = src_.substr(start, pos_ - start);
  if (!is_float && text.find_first_of("eE") != std::string_view::npos &&
      text.find_first_of("xX") == std::string_view::npos) {
    is_float = true;
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const auto end = scan_string_literal(src_, pos_);
  if (!end) {
    // Unterminated: consume the rest of the line so lexing makes progress.
    while (!eof() && peek() != '\n') {
      advance(1);
    }
    return make_token(TokenKind::Unknown, start);
  }
  pos_ = *end;
  return make_token(TokenKind::StringLiteral, start);
}

Token Lexer::lex_operator()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (peek() == '.') {
    // Dot operators (..<, ...) may contain further dots.
    while (!eof() && (peek() == '.' || is_operator_char(peek()))) {
      if (starts_with("//") || starts_with("/*")) break;
      advance(1);
    }
  } else {
    while (!eof() && is_operator_char(peek())) {
      if (pos_ != start && (starts_with("//") || starts_with("/*"))) break;
      advance(1);
    }
  }

  Token t = make_token(TokenKind::Operator, start);
  if (t.text == "->") {
    t.kind = TokenKind::Arrow;
  } else if (t.text == "=") {
    t.kind = TokenKind::Eq;
  } else if (t.text == ".") {
    t.kind = TokenKind::Dot;
  }
  return t;
}

Token Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);

  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (starts_with("//")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const char ch = peek();
  const auto c = static_cast<unsigned char>(ch);

  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (ch == '"' || (ch == '#' && peek(count_hashes(src_, pos_)) == '"')) {
    return lex_string();
  }
  if (ch == '`') {
    return lex_escaped_identifier();
  }
  if (ch == '.' || is_operator_char(ch)) {
    return lex_operator();
  }

  advance(1);
  switch (ch) {
    case '(':
      return make_token(TokenKind::LParen, start);
    case ')':
      return make_token(TokenKind::RParen, start);
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case ':':
      return make_token(TokenKind::Colon, start);
    case ';':
      return make_token(TokenKind::Semicolon, start);
    case '@':
      return make_token(TokenKind::At, start);
    case '#':
      return make_token(TokenKind::Hash, start);
    case '\\':
      return make_token(TokenKind::Backslash, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    t.newlineBefore = newline_pending_;
    newline_pending_ = false;
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace swlint::syntax
