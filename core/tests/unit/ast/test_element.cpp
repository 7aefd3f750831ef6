#include <gtest/gtest.h>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/ast_context.hpp"
#include "syntree/ast/element.hpp"

using namespace syntree;

TEST(AstElement, TagFollowsPayload)
{
  AstContext ctx("x");
  const Token * tok = ctx.create_token(TokenKind::Name, 0, 0, 1);
  NameExpression * name = ctx.create<NameExpression>({tok});

  const Element none;
  EXPECT_TRUE(none.is_null());
  EXPECT_FALSE(static_cast<bool>(none));
  EXPECT_EQ(none.node(), nullptr);
  EXPECT_EQ(none.token(), nullptr);

  const Element t(tok);
  EXPECT_TRUE(t.is_token());
  EXPECT_EQ(t.token(), tok);
  EXPECT_EQ(t.node(), nullptr);

  const Element n(name);
  EXPECT_TRUE(n.is_node());
  EXPECT_EQ(n.node(), name);
  EXPECT_EQ(n.token(), nullptr);

  // A null pointer of either kind is an absent element
  EXPECT_TRUE(Element(static_cast<Node *>(nullptr)).is_null());
  EXPECT_TRUE(Element(static_cast<const Token *>(nullptr)).is_null());
  EXPECT_TRUE(Element(nullptr).is_null());
}

TEST(AstElement, EqualityComparesIdentity)
{
  AstContext ctx("ab");
  const Token * a = ctx.create_token(TokenKind::Name, 0, 0, 1);
  const Token * b = ctx.create_token(TokenKind::Name, 1, 1, 1);

  EXPECT_EQ(Element(a), Element(a));
  EXPECT_NE(Element(a), Element(b));
  EXPECT_NE(Element(a), Element());
  EXPECT_EQ(Element(), Element(nullptr));
}

TEST(AstElement, CastingThroughElements)
{
  AstContext ctx("x;");
  const Token * x = ctx.create_token(TokenKind::Name, 0, 0, 1);
  const Token * semi = ctx.create_token(TokenKind::Semicolon, 1, 1, 1);
  auto * name = ctx.create<NameExpression>({x});
  auto * stmt = ctx.create<ExpressionStatement>({name, semi});

  const Element expr = stmt->expression();
  EXPECT_TRUE(isa<NameExpression>(expr));
  EXPECT_TRUE(isa<Expression>(expr));
  EXPECT_FALSE(isa<Statement>(expr));
  EXPECT_EQ(dyn_cast<NameExpression>(expr), name);
  EXPECT_EQ(dyn_cast<LiteralExpression>(expr), nullptr);
  EXPECT_EQ(cast<NameExpression>(expr)->name().token(), x);

  // Tokens are never nodes
  EXPECT_FALSE(isa<NameExpression>(stmt->semicolon()));
  EXPECT_EQ(dyn_cast<Expression>(stmt->semicolon()), nullptr);
}

TEST(AstElement, CategoryClassof)
{
  AstContext ctx("var x;");
  const Token * kw = ctx.create_token(TokenKind::VarKeyword, 0, 0, 3);
  const Token * x = ctx.create_token(TokenKind::Name, 3, 4, 2);
  const Token * semi = ctx.create_token(TokenKind::Semicolon, 5, 5, 1);
  const Node * decl = ctx.create<VariableDeclaration>({kw, x, nullptr, nullptr, semi});

  EXPECT_TRUE(isa<VariableDeclaration>(decl));
  EXPECT_TRUE(isa<Declaration>(decl));
  EXPECT_TRUE(isa<Statement>(decl));
  EXPECT_FALSE(isa<Expression>(decl));
  EXPECT_FALSE(isa<FunctionDeclaration>(decl));
  EXPECT_EQ(dyn_cast<Declaration>(decl), decl);
}
