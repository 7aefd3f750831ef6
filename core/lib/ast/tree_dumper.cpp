// syntree/ast/tree_dumper.cpp - Debug tree output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "syntree/ast/tree_dumper.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <rang.hpp>
#include <sstream>
#include <utility>
#include <vector>

#include "syntree/syntax/kind_registry.hpp"

namespace syntree
{
namespace
{

std::string escape(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  return out;
}

/// Stream rang manipulators only when color is enabled for this dumper
template <typename... Manips>
void paint(std::ostream & os, bool enabled, Manips... manips)
{
  if (enabled) {
    (os << ... << manips);
  }
}

}  // namespace

TreeDumper::TreeDumper(std::ostream & os, DumpOptions opts) : os_(os), opts_(opts) {}

void TreeDumper::print_kind(const Node * node)
{
  paint(os_, opts_.use_color, rang::style::bold, rang::fg::green);
  os_ << node->kind_name();
  paint(os_, opts_.use_color, rang::style::reset, rang::fg::reset);
  os_ << "\n";
}

void TreeDumper::dump(const Node * node)
{
  if (node == nullptr) {
    fmt::print(os_, "<null>\n");
    return;
  }
  print_kind(node);
  prefix_.clear();
  dump_children(node);
}

void TreeDumper::dump_children(const Node * node)
{
  std::vector<std::pair<std::string, Element>> items;
  for (const NamedSlot & slot : node->slots()) {
    if (slot.is_list()) {
      for (size_t i = 0; i < slot.elements.size(); ++i) {
        items.emplace_back(fmt::format("{}[{}]", slot.name, i), slot.elements[i]);
      }
    } else {
      items.emplace_back(std::string(slot.name), slot.value());
    }
  }

  for (size_t i = 0; i < items.size(); ++i) {
    dump_element(items[i].first, items[i].second, i + 1 == items.size(), node->file_contents());
  }
}

void TreeDumper::dump_element(
  std::string_view label, Element e, bool isLast, std::string_view document)
{
  fmt::print(os_, "{}{}{}: ", prefix_, isLast ? "`-" : "|-", label);

  if (const Token * token = e.token()) {
    print_token(*token, document);
    return;
  }

  const Node * node = e.node();
  if (node == nullptr) {
    paint(os_, opts_.use_color, rang::style::dim);
    os_ << "<absent>";
    paint(os_, opts_.use_color, rang::style::reset);
    os_ << "\n";
    return;
  }

  print_kind(node);

  const std::string saved = prefix_;
  prefix_ += isLast ? "  " : "| ";
  dump_children(node);
  prefix_ = saved;
}

void TreeDumper::print_token(const Token & token, std::string_view document)
{
  paint(os_, opts_.use_color, rang::fg::blue);
  os_ << to_string(token.kind);
  paint(os_, opts_.use_color, rang::fg::reset);
  os_ << " '";
  paint(os_, opts_.use_color, rang::fg::yellow);
  os_ << escape(token.text(document));
  paint(os_, opts_.use_color, rang::fg::reset);
  os_ << "'";
  if (opts_.show_trivia && token.trivia_width() > 0) {
    fmt::print(os_, " trivia='{}'", escape(token.leading_trivia(document)));
  }
  os_ << "\n";
}

std::string dump_tree(const Node * node, DumpOptions opts)
{
  opts.use_color = false;
  std::ostringstream oss;
  TreeDumper dumper(oss, opts);
  dumper.dump(node);
  return oss.str();
}

}  // namespace syntree
