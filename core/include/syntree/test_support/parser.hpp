// syntree/test_support/parser.hpp - Recursive-descent parser of the reference grammar
//
// Builds lossless trees for tests. It never fails: a missing token becomes a
// zero-width MissingToken, a missing expression a MissingExpression, and
// tokens that start no statement are collected into an ErrorStatement. Every
// recovery reports a diagnostic.
//
#pragma once

#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/ast_context.hpp"
#include "syntree/basic/diagnostic.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree::test_support
{

class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] SourceFile * parse_source_file();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  /// Move the current token into the arena and advance
  const Token * take();

  /// The current token if it is of kind `k`, else a MissingToken (reported)
  const Token * expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);

  [[nodiscard]] static bool starts_expression(TokenKind k) noexcept;
  [[nodiscard]] static bool starts_statement(TokenKind k) noexcept;

  // Statements
  [[nodiscard]] Statement * parse_statement();
  [[nodiscard]] CompoundStatement * parse_compound_statement();
  [[nodiscard]] IfStatement * parse_if_statement();
  [[nodiscard]] WhileStatement * parse_while_statement();
  [[nodiscard]] ReturnStatement * parse_return_statement();
  [[nodiscard]] FunctionDeclaration * parse_function_declaration();
  [[nodiscard]] VariableDeclaration * parse_variable_declaration();
  [[nodiscard]] ErrorStatement * parse_error_statement();

  // Supporting nodes
  [[nodiscard]] Parameter * parse_parameter();

  // Expressions
  [[nodiscard]] Expression * parse_expression();
  [[nodiscard]] Expression * parse_or();
  [[nodiscard]] Expression * parse_and();
  [[nodiscard]] Expression * parse_equality();
  [[nodiscard]] Expression * parse_comparison();
  [[nodiscard]] Expression * parse_add();
  [[nodiscard]] Expression * parse_mul();
  [[nodiscard]] Expression * parse_unary();
  [[nodiscard]] Expression * parse_postfix();
  [[nodiscard]] Expression * parse_primary();

  /// Left-associative binary level over `ops`, operands from `next`
  template <typename Next>
  Expression * parse_binary(std::initializer_list<TokenKind> ops, Next next);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace syntree::test_support
