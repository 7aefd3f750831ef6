#include "syntree/test_support/parser.hpp"

#include <algorithm>
#include <string>

#include "syntree/syntax/kind_registry.hpp"

namespace syntree::test_support
{

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  // The lexer always ends the stream with EndOfFileToken
  const size_t i = std::min(idx_ + lookahead, tokens_.size() - 1);
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::EndOfFileToken); }

const Token * Parser::take()
{
  const Token * token = ast_.create_token(cur());
  if (!at_eof()) {
    ++idx_;
  }
  return token;
}

const Token * Parser::expect(TokenKind k, std::string_view what)
{
  if (at(k)) {
    return take();
  }
  error_at(cur(), "expected " + std::string(what));
  // Zero-width, placed where the current token's trivia begins
  const uint32_t pos = cur().full_start;
  return ast_.create_token(TokenKind::MissingToken, pos, pos, 0);
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(
    SourceRange(t.start, t.end()), std::string(msg), "found " + std::string(to_string(t.kind)));
}

bool Parser::starts_expression(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Name:
    case TokenKind::IntegerLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::OpenParen:
    case TokenKind::Exclamation:
    case TokenKind::Minus:
      return true;
    default:
      return false;
  }
}

bool Parser::starts_statement(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::OpenBrace:
    case TokenKind::IfKeyword:
    case TokenKind::WhileKeyword:
    case TokenKind::ReturnKeyword:
    case TokenKind::FunctionKeyword:
    case TokenKind::VarKeyword:
    case TokenKind::Semicolon:
      return true;
    default:
      return starts_expression(k);
  }
}

// ============================================================================
// Statements
// ============================================================================

SourceFile * Parser::parse_source_file()
{
  std::vector<Element> statements;
  while (!at_eof()) {
    // A stray '}' would otherwise end no block and never be consumed
    if (at(TokenKind::CloseBrace)) {
      statements.emplace_back(parse_error_statement());
    } else {
      statements.emplace_back(parse_statement());
    }
  }
  const Token * eof = take();
  return ast_.create<SourceFile>({std::move(statements), eof});
}

Statement * Parser::parse_statement()
{
  switch (cur().kind) {
    case TokenKind::OpenBrace:
      return parse_compound_statement();
    case TokenKind::IfKeyword:
      return parse_if_statement();
    case TokenKind::WhileKeyword:
      return parse_while_statement();
    case TokenKind::ReturnKeyword:
      return parse_return_statement();
    case TokenKind::FunctionKeyword:
      return parse_function_declaration();
    case TokenKind::VarKeyword:
      return parse_variable_declaration();
    case TokenKind::Semicolon:
      return ast_.create<EmptyStatement>({take()});
    default:
      break;
  }

  // Nothing left for this statement: an empty expression statement stands in
  if (at_eof() || at(TokenKind::CloseBrace)) {
    Expression * missing = parse_primary();
    const Token * semi = expect(TokenKind::Semicolon, "';'");
    return ast_.create<ExpressionStatement>({missing, semi});
  }

  if (starts_expression(cur().kind)) {
    Expression * expr = parse_expression();
    const Token * semi = expect(TokenKind::Semicolon, "';' after expression");
    return ast_.create<ExpressionStatement>({expr, semi});
  }

  return parse_error_statement();
}

CompoundStatement * Parser::parse_compound_statement()
{
  const Token * open = expect(TokenKind::OpenBrace, "'{'");
  std::vector<Element> statements;
  while (!at(TokenKind::CloseBrace) && !at_eof()) {
    statements.emplace_back(parse_statement());
  }
  const Token * close = expect(TokenKind::CloseBrace, "'}'");
  return ast_.create<CompoundStatement>({open, std::move(statements), close});
}

IfStatement * Parser::parse_if_statement()
{
  const Token * kw = take();
  const Token * open = expect(TokenKind::OpenParen, "'(' after 'if'");
  Expression * condition = parse_expression();
  const Token * close = expect(TokenKind::CloseParen, "')' after condition");
  Statement * thenStatement = parse_statement();

  ElseClause * elseClause = nullptr;
  if (at(TokenKind::ElseKeyword)) {
    const Token * elseKw = take();
    Statement * elseStatement = parse_statement();
    elseClause = ast_.create<ElseClause>({elseKw, elseStatement});
  }

  return ast_.create<IfStatement>({kw, open, condition, close, thenStatement, elseClause});
}

WhileStatement * Parser::parse_while_statement()
{
  const Token * kw = take();
  const Token * open = expect(TokenKind::OpenParen, "'(' after 'while'");
  Expression * condition = parse_expression();
  const Token * close = expect(TokenKind::CloseParen, "')' after condition");
  Statement * body = parse_statement();
  return ast_.create<WhileStatement>({kw, open, condition, close, body});
}

ReturnStatement * Parser::parse_return_statement()
{
  const Token * kw = take();
  Expression * value = nullptr;
  if (!at(TokenKind::Semicolon) && starts_expression(cur().kind)) {
    value = parse_expression();
  }
  const Token * semi = expect(TokenKind::Semicolon, "';' after return");
  return ast_.create<ReturnStatement>({kw, value, semi});
}

FunctionDeclaration * Parser::parse_function_declaration()
{
  const Token * kw = take();
  const Token * name = expect(TokenKind::Name, "function name");
  const Token * open = expect(TokenKind::OpenParen, "'(' after function name");

  std::vector<Element> parameters;
  while (at(TokenKind::Name)) {
    parameters.emplace_back(parse_parameter());
    if (!at(TokenKind::Comma)) break;
    parameters.emplace_back(take());
  }

  const Token * close = expect(TokenKind::CloseParen, "')' after parameters");

  CompoundStatement * body = nullptr;
  if (at(TokenKind::OpenBrace)) {
    body = parse_compound_statement();
  } else {
    error_at(cur(), "expected function body");
  }

  return ast_.create<FunctionDeclaration>({kw, name, open, std::move(parameters), close, body});
}

VariableDeclaration * Parser::parse_variable_declaration()
{
  const Token * kw = take();
  const Token * name = expect(TokenKind::Name, "variable name");

  const Token * equals = nullptr;
  Expression * initializer = nullptr;
  if (at(TokenKind::Equals)) {
    equals = take();
    initializer = parse_expression();
  }

  const Token * semi = expect(TokenKind::Semicolon, "';' after variable declaration");
  return ast_.create<VariableDeclaration>({kw, name, equals, initializer, semi});
}

ErrorStatement * Parser::parse_error_statement()
{
  error_at(cur(), "unexpected token");

  std::vector<Element> skipped;
  skipped.emplace_back(take());
  while (!at_eof() && !at(TokenKind::CloseBrace) && !starts_statement(cur().kind)) {
    skipped.emplace_back(take());
  }
  return ast_.create<ErrorStatement>({std::move(skipped)});
}

// ============================================================================
// Supporting nodes
// ============================================================================

Parameter * Parser::parse_parameter()
{
  const Token * name = take();
  const Token * equals = nullptr;
  Expression * defaultValue = nullptr;
  if (at(TokenKind::Equals)) {
    equals = take();
    defaultValue = parse_expression();
  }
  return ast_.create<Parameter>({name, equals, defaultValue});
}

// ============================================================================
// Expressions
// ============================================================================

template <typename Next>
Expression * Parser::parse_binary(std::initializer_list<TokenKind> ops, Next next)
{
  Expression * lhs = (this->*next)();
  while (std::find(ops.begin(), ops.end(), cur().kind) != ops.end()) {
    const Token * op = take();
    Expression * rhs = (this->*next)();
    lhs = ast_.create<BinaryExpression>({lhs, op, rhs});
  }
  return lhs;
}

Expression * Parser::parse_expression()
{
  Expression * lhs = parse_or();
  if (at(TokenKind::Equals)) {
    const Token * op = take();
    Expression * rhs = parse_expression();  // right-associative
    return ast_.create<AssignmentExpression>({lhs, op, rhs});
  }
  return lhs;
}

Expression * Parser::parse_or()
{
  return parse_binary({TokenKind::BarBar}, &Parser::parse_and);
}

Expression * Parser::parse_and()
{
  return parse_binary({TokenKind::AmpersandAmpersand}, &Parser::parse_equality);
}

Expression * Parser::parse_equality()
{
  return parse_binary(
    {TokenKind::EqualsEquals, TokenKind::ExclamationEquals}, &Parser::parse_comparison);
}

Expression * Parser::parse_comparison()
{
  return parse_binary({TokenKind::LessThan, TokenKind::GreaterThan}, &Parser::parse_add);
}

Expression * Parser::parse_add()
{
  return parse_binary({TokenKind::Plus, TokenKind::Minus}, &Parser::parse_mul);
}

Expression * Parser::parse_mul()
{
  return parse_binary({TokenKind::Asterisk, TokenKind::Slash}, &Parser::parse_unary);
}

Expression * Parser::parse_unary()
{
  if (at(TokenKind::Exclamation) || at(TokenKind::Minus)) {
    const Token * op = take();
    Expression * operand = parse_unary();
    return ast_.create<UnaryExpression>({op, operand});
  }
  return parse_postfix();
}

Expression * Parser::parse_postfix()
{
  Expression * expr = parse_primary();
  while (at(TokenKind::OpenParen)) {
    const Token * open = take();
    std::vector<Element> arguments;
    if (!at(TokenKind::CloseParen)) {
      for (;;) {
        arguments.emplace_back(parse_expression());
        if (!at(TokenKind::Comma)) break;
        arguments.emplace_back(take());
      }
    }
    const Token * close = expect(TokenKind::CloseParen, "')' after arguments");
    expr = ast_.create<CallExpression>({expr, open, std::move(arguments), close});
  }
  return expr;
}

Expression * Parser::parse_primary()
{
  switch (cur().kind) {
    case TokenKind::Name:
      return ast_.create<NameExpression>({take()});
    case TokenKind::IntegerLiteral:
    case TokenKind::StringLiteral:
      return ast_.create<LiteralExpression>({take()});
    case TokenKind::OpenParen: {
      const Token * open = take();
      Expression * inner = parse_expression();
      const Token * close = expect(TokenKind::CloseParen, "')'");
      return ast_.create<ParenthesizedExpression>({open, inner, close});
    }
    default:
      break;
  }

  error_at(cur(), "expected expression");
  const uint32_t pos = cur().full_start;
  const Token * missing = ast_.create_token(TokenKind::MissingToken, pos, pos, 0);
  return ast_.create<MissingExpression>({missing});
}

}  // namespace syntree::test_support
