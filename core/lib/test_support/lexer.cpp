#include "syntree/test_support/lexer.hpp"

#include <cctype>

namespace syntree::test_support
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

}  // namespace

TokenKind keyword_kind(std::string_view ident) noexcept
{
  if (ident == "function") return TokenKind::FunctionKeyword;
  if (ident == "var") return TokenKind::VarKeyword;
  if (ident == "if") return TokenKind::IfKeyword;
  if (ident == "else") return TokenKind::ElseKeyword;
  if (ident == "while") return TokenKind::WhileKeyword;
  if (ident == "return") return TokenKind::ReturnKeyword;
  return TokenKind::Name;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }

    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }

    if (starts_with("/*")) {
      const auto start = static_cast<uint32_t>(pos_);
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (eof()) {
        diags_.report_error(
          SourceRange(start, static_cast<uint32_t>(pos_)), "unterminated block comment");
      } else {
        advance(2);
      }
      continue;
    }

    break;
  }
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> tokens;
  for (;;) {
    tokens.push_back(next_token());
    if (tokens.back().kind == TokenKind::EndOfFileToken) break;
  }
  return tokens;
}

Token Lexer::next_token()
{
  const auto fullStart = static_cast<uint32_t>(pos_);
  skip_trivia();
  const auto start = static_cast<uint32_t>(pos_);

  TokenKind kind = TokenKind::EndOfFileToken;
  if (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (is_ident_start(c)) {
      kind = lex_identifier_or_keyword();
    } else if (std::isdigit(c) != 0) {
      kind = lex_number();
    } else if (c == '"') {
      kind = lex_string();
    } else {
      kind = lex_punctuation();
    }
  }

  return Token{kind, fullStart, start, static_cast<uint32_t>(pos_) - fullStart};
}

TokenKind Lexer::lex_identifier_or_keyword()
{
  const size_t start = pos_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return keyword_kind(src_.substr(start, pos_ - start));
}

TokenKind Lexer::lex_number()
{
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }
  return TokenKind::IntegerLiteral;
}

TokenKind Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // opening quote
  while (!eof() && peek() != '"' && peek() != '\n') {
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }
  if (peek() == '"') {
    advance(1);
  } else {
    diags_.report_error(SourceRange(start, static_cast<uint32_t>(pos_)), "unterminated string");
  }
  return TokenKind::StringLiteral;
}

TokenKind Lexer::lex_punctuation()
{
  struct Punct
  {
    std::string_view text;
    TokenKind kind;
  };
  // Longest spellings first
  static constexpr Punct k_puncts[] = {
    {"==", TokenKind::EqualsEquals},
    {"!=", TokenKind::ExclamationEquals},
    {"&&", TokenKind::AmpersandAmpersand},
    {"||", TokenKind::BarBar},
    {"(", TokenKind::OpenParen},
    {")", TokenKind::CloseParen},
    {"{", TokenKind::OpenBrace},
    {"}", TokenKind::CloseBrace},
    {",", TokenKind::Comma},
    {";", TokenKind::Semicolon},
    {"=", TokenKind::Equals},
    {"<", TokenKind::LessThan},
    {">", TokenKind::GreaterThan},
    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Asterisk},
    {"/", TokenKind::Slash},
    {"!", TokenKind::Exclamation},
  };

  for (const Punct & p : k_puncts) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return p.kind;
    }
  }

  advance(1);
  return TokenKind::UnknownToken;
}

}  // namespace syntree::test_support
