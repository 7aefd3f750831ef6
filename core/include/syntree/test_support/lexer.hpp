// syntree/test_support/lexer.hpp - Trivia-aware lexer of the reference grammar
//
// Whitespace and comments are attached to the following token as leading
// trivia; trailing trivia of the file ends up on the end-of-file token.
// Together the tokens tile the whole buffer.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "syntree/basic/diagnostic.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree::test_support
{

class Lexer
{
public:
  Lexer(std::string_view src, DiagnosticBag & diags) : src_(src), diags_(diags) {}

  /// Every token of the buffer; the last one is always EndOfFileToken
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

  void skip_trivia();

  [[nodiscard]] TokenKind lex_identifier_or_keyword();
  [[nodiscard]] TokenKind lex_number();
  [[nodiscard]] TokenKind lex_string();
  [[nodiscard]] TokenKind lex_punctuation();

  std::string_view src_;
  DiagnosticBag & diags_;
  size_t pos_ = 0;
};

/// Keyword kind for `ident`, or Name
[[nodiscard]] TokenKind keyword_kind(std::string_view ident) noexcept;

}  // namespace syntree::test_support
