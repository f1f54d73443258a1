#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "swlint/syntax/token.hpp"

namespace swlint::syntax
{

class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  /// Lex a detached buffer (file id 0), convenient for tests and tools.
  explicit Lexer(std::string_view src) : Lexer(FileId{0}, src) {}

  /// Lex the whole buffer. The last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_escaped_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
  bool newline_pending_ = true;  // start of file counts as start of line
};

}  // namespace swlint::syntax
