#include <gtest/gtest.h>

#include <string_view>

#include "syntree/syntax/token.hpp"

using syntree::Token;
using syntree::TokenKind;

TEST(SyntaxToken, WidthsAndTextViews)
{
  const std::string_view doc = "  /* c */ foo;";
  const Token t{TokenKind::Name, 0, 10, 13};

  EXPECT_EQ(t.end(), 13U);
  EXPECT_EQ(t.full_width(), 13U);
  EXPECT_EQ(t.width(), 3U);
  EXPECT_EQ(t.trivia_width(), 10U);

  EXPECT_EQ(t.leading_trivia(doc), "  /* c */ ");
  EXPECT_EQ(t.text(doc), "foo");
  EXPECT_EQ(t.full_text(doc), "  /* c */ foo");
}

TEST(SyntaxToken, ZeroWidthToken)
{
  const std::string_view doc = "a ";
  const Token missing{TokenKind::MissingToken, 2, 2, 0};

  EXPECT_EQ(missing.width(), 0U);
  EXPECT_EQ(missing.end(), 2U);
  EXPECT_EQ(missing.text(doc), "");
  EXPECT_EQ(missing.full_text(doc), "");
}

TEST(SyntaxToken, TriviaOnlyEndOfFile)
{
  const std::string_view doc = "x\n// done\n";
  const Token eof{TokenKind::EndOfFileToken, 1, 10, 9};

  EXPECT_EQ(eof.width(), 0U);
  EXPECT_EQ(eof.leading_trivia(doc), "\n// done\n");
  EXPECT_EQ(eof.text(doc), "");
}
