// syntree/ast/walker.cpp - Cursor stack traversal
#include "syntree/ast/walker.hpp"

#include <string>

#include "syntree/ast/node.hpp"
#include "syntree/basic/error.hpp"

namespace syntree::detail
{

Element ChildCursor::next()
{
  if (node_ == nullptr) return {};

  while (slot_ < node_->slot_count()) {
    const gsl::span<const Element> elements = node_->slot_list(slot_);
    while (index_ < elements.size()) {
      const Element e = elements[index_++];
      switch (e.tag()) {
        case Element::Tag::None:
          continue;
        case Element::Tag::Node:
        case Element::Tag::Token:
          return e;
      }
      throw TreeInvariantError(
        "element with unknown tag " + std::to_string(static_cast<int>(e.tag())) + " in " +
        std::string(node_->kind_name()));
    }
    ++slot_;
    index_ = 0;
  }
  return {};
}

// ============================================================================
// ChildWalker
// ============================================================================

ChildWalker::ChildWalker(const Node * parent, ElementFilter filter)
: cursor_(parent), filter_(filter)
{
  advance();
}

void ChildWalker::advance()
{
  for (;;) {
    const Element e = cursor_.next();
    if (e.is_null()) break;
    if (filter_ == ElementFilter::Nodes && !e.is_node()) continue;
    if (filter_ == ElementFilter::Tokens && !e.is_token()) continue;
    current_ = e;
    return;
  }
  current_ = Element{};
}

// ============================================================================
// DescendantWalker
// ============================================================================

DescendantWalker::DescendantWalker(
  const Node * root, ElementFilter filter, const DescendPredicate * predicate)
: filter_(filter), predicate_(predicate)
{
  // The root itself is not yielded and is always entered
  stack_.emplace_back(root);
  advance();
}

bool DescendantWalker::should_descend(const Node * node) const
{
  if (predicate_ == nullptr || !*predicate_) return true;
  return (*predicate_)(node);
}

void DescendantWalker::advance()
{
  if (pending_ != nullptr) {
    const Node * node = pending_;
    pending_ = nullptr;
    if (should_descend(node)) {
      stack_.emplace_back(node);
    }
  }

  while (!stack_.empty()) {
    const Element e = stack_.back().next();
    if (e.is_null()) {
      stack_.pop_back();
      continue;
    }

    if (e.is_node()) {
      if (filter_ == ElementFilter::Tokens) {
        if (should_descend(e.node())) {
          stack_.emplace_back(e.node());
        }
        continue;
      }
      current_ = e;
      pending_ = e.node();
      return;
    }

    if (filter_ == ElementFilter::Nodes) continue;
    current_ = e;
    return;
  }

  current_ = Element{};
}

}  // namespace syntree::detail
