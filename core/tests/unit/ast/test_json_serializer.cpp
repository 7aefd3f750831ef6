#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/json_serializer.hpp"
#include "syntree/test_support/parse_helpers.hpp"

using namespace syntree;
using syntree::test_support::parse;

TEST(AstJsonSerializer, SerializesSlotsInOrder)
{
  auto unit = parse("x;");
  ASSERT_TRUE(unit.diags.empty());

  EXPECT_EQ(
    to_json_string(unit.file),
    R"({"SourceFile":{"statementList":[{"ExpressionStatement":{"expression":)"
    R"({"NameExpression":{"name":{"kind":"Name","fullStart":0,"start":0,"length":1}}},)"
    R"("semicolon":{"kind":"Semicolon","fullStart":1,"start":1,"length":1}}}],)"
    R"("endOfFileToken":{"kind":"EndOfFileToken","fullStart":2,"start":2,"length":0}}})");
}

TEST(AstJsonSerializer, AbsentSlotIsNullAndEmptyListIsArray)
{
  auto unit = parse("return;");
  ASSERT_TRUE(unit.diags.empty());
  const auto * ret = cast<ReturnStatement>(unit.file->statementList()[0]);

  const auto j = to_json(ret);
  ASSERT_TRUE(j.contains("ReturnStatement"));
  const auto & fields = j["ReturnStatement"];
  ASSERT_EQ(fields.size(), 3U);
  EXPECT_TRUE(fields["expression"].is_null());
  EXPECT_EQ(fields["semicolon"]["kind"], "Semicolon");

  auto empty = parse("");
  const auto file = to_json(empty.file);
  EXPECT_TRUE(file["SourceFile"]["statementList"].is_array());
  EXPECT_TRUE(file["SourceFile"]["statementList"].empty());
}

TEST(AstJsonSerializer, CompactTokens)
{
  auto unit = parse("  foo;");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = cast<ExpressionStatement>(unit.file->statementList()[0]);

  SerializeOptions opts;
  opts.tokens = TokenFormat::Compact;
  EXPECT_EQ(
    to_json_string(stmt->expression().node(), opts),
    R"({"NameExpression":{"name":{"kind":"Name","textLength":3}}})");

  const Token * name = cast<NameExpression>(stmt->expression())->name().token();
  const auto full = to_json(*name);
  EXPECT_EQ(full["fullStart"], 0);
  EXPECT_EQ(full["start"], 2);
  EXPECT_EQ(full["length"], 5);
}

TEST(AstJsonSerializer, ListsKeepTokensBetweenNodes)
{
  auto unit = parse("f(a, 1);");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = cast<ExpressionStatement>(unit.file->statementList()[0]);

  const auto j = to_json(stmt->expression());
  const auto & args = j["CallExpression"]["arguments"];
  ASSERT_EQ(args.size(), 3U);
  EXPECT_TRUE(args[0].contains("NameExpression"));
  EXPECT_EQ(args[1]["kind"], "Comma");
  EXPECT_TRUE(args[2].contains("LiteralExpression"));
}

TEST(AstJsonSerializer, NullNode)
{
  EXPECT_TRUE(to_json(static_cast<const Node *>(nullptr)).is_null());
  EXPECT_TRUE(to_json(Element{}).is_null());
  EXPECT_EQ(to_json_string(nullptr), "null");
}

TEST(AstJsonSerializer, IndentedOutput)
{
  auto unit = parse(";");
  const std::string text = to_json_string(unit.file, {}, 2);
  EXPECT_NE(text.find("\n  \"SourceFile\": {"), std::string::npos);
  EXPECT_EQ(nlohmann::ordered_json::parse(text), to_json(unit.file));
}
