#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/tree_verifier.hpp"
#include "syntree/test_support/parse_helpers.hpp"

using namespace syntree;
using syntree::test_support::parse;

namespace
{

class TreeProperties : public ::testing::TestWithParam<std::string>
{
};

const std::vector<std::string> k_sources = {
  "",
  "   \n// only trivia\n",
  "x;",
  "function add(a, b = 2) {\n  return a + b;\n}\nvar x = add(1, -2);\n",
  "if (x > 1) { x = x * 2; } else { while (!x) x = 1; }\n",
  "/* c */ x = ;",
  "  }  stray ( ;",
  "f(1, 2",
  "var s = \"unterminated",
  "@@ var",
  "a == b != c && d || (e < f);;",
  "function g( { }",
};

}  // namespace

TEST_P(TreeProperties, FullTextRoundTrips)
{
  auto unit = parse(GetParam());
  EXPECT_EQ(unit.file->full_text(), GetParam());
  EXPECT_EQ(unit.file->full_width(), GetParam().size());
}

TEST_P(TreeProperties, VerifierAcceptsParsedTree)
{
  auto unit = parse(GetParam());
  const DiagnosticBag problems = verify_tree(unit.file);
  for (const Diagnostic & d : problems) {
    ADD_FAILURE() << d.code << ": " << d.message;
  }
}

TEST_P(TreeProperties, WidthsComposeFromTokens)
{
  auto unit = parse(GetParam());
  for (const Node * node : unit.file->descendant_nodes()) {
    const Token * first = node->first_token();
    ASSERT_NE(first, nullptr) << node->kind_name();

    uint32_t sum = 0;
    for (const Token * t : node->descendant_tokens()) sum += t->full_width();

    EXPECT_EQ(node->full_width(), sum) << node->kind_name();
    EXPECT_EQ(node->full_start(), first->full_start) << node->kind_name();
    EXPECT_EQ(node->start(), first->start) << node->kind_name();
    EXPECT_EQ(node->width(), node->full_width() - first->trivia_width()) << node->kind_name();
    EXPECT_EQ(node->full_text().size(), node->full_width()) << node->kind_name();
  }
}

TEST_P(TreeProperties, EndPositionNeverPrecedesNodeEnd)
{
  auto unit = parse(GetParam());
  for (const Node * node : unit.file->descendant_nodes()) {
    EXPECT_GE(node->end_position(), node->full_start() + node->full_width())
      << node->kind_name();
    EXPECT_LE(node->end_position(), unit.file->end_position()) << node->kind_name();
  }
}

TEST_P(TreeProperties, PointLocationIsSound)
{
  auto unit = parse(GetParam());
  const Token * eof = unit.file->endOfFileToken().token();
  const bool hasStatements = !unit.file->statementList().empty();

  for (uint32_t offset = 0; offset <= unit.text().size(); ++offset) {
    const Node * found = unit.file->descendant_node_at(offset);
    if (found == nullptr) {
      EXPECT_FALSE(hasStatements && offset < eof->full_start) << "offset " << offset;
      continue;
    }
    EXPECT_LE(found->full_start(), offset);
    EXPECT_LT(offset, found->end_position());

    // No deeper node contains the offset
    for (const Node * below : found->descendant_nodes()) {
      const bool contains = offset >= below->full_start() && offset < below->end_position();
      EXPECT_FALSE(contains) << below->kind_name() << " at offset " << offset;
    }
  }
}

TEST_P(TreeProperties, ParentsMatchContainment)
{
  auto unit = parse(GetParam());
  EXPECT_EQ(unit.file->parent(), nullptr);
  std::vector<const Node *> nodes = unit.file->descendant_nodes().to_vector();
  nodes.push_back(unit.file);
  for (const Node * node : nodes) {
    for (const Node * child : node->child_nodes()) {
      EXPECT_EQ(child->parent(), node);
      EXPECT_EQ(child->root(), unit.file);
    }
  }
}

INSTANTIATE_TEST_SUITE_P(ParsedSources, TreeProperties, ::testing::ValuesIn(k_sources));
