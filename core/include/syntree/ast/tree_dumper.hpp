// syntree/ast/tree_dumper.hpp - Debug tree output
//
// Renders a syntax tree one element per line with its slot name, kind and
// token text. This is a debugging aid, not a source formatter.
//
#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "syntree/ast/element.hpp"
#include "syntree/ast/node.hpp"

namespace syntree
{

struct DumpOptions
{
  bool show_trivia = false;  ///< Print the leading trivia of each token
  bool use_color = false;    ///< Color this dumper's output; rang's global mode is untouched
};

/**
 * Dumps a syntax tree in a human-readable tree format.
 *
 * @code
 *   SourceFile
 *   |-statementList[0]: ExpressionStatement
 *   | |-expression: NameExpression
 *   | | `-name: Name 'x'
 *   | `-semicolon: Semicolon ';'
 *   `-endOfFileToken: EndOfFileToken ''
 * @endcode
 *
 * Absent single slots are shown as `<absent>`. Newlines, carriage returns
 * and tabs in token text are escaped.
 */
class TreeDumper
{
public:
  explicit TreeDumper(std::ostream & os, DumpOptions opts = {});

  /// Dump a node and its subtree
  void dump(const Node * node);

private:
  void print_kind(const Node * node);
  void dump_children(const Node * node);
  void dump_element(std::string_view label, Element e, bool isLast, std::string_view document);
  void print_token(const Token & token, std::string_view document);

  std::ostream & os_;
  DumpOptions opts_;
  std::string prefix_;
};

/// Dump into a string (without color)
[[nodiscard]] std::string dump_tree(const Node * node, DumpOptions opts = {});

}  // namespace syntree
