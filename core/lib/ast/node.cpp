// syntree/ast/node.cpp - Navigation, slot access and positions
#include "syntree/ast/node.hpp"

#include <stdexcept>
#include <string>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/child_schema.hpp"
#include "syntree/basic/error.hpp"
#include "syntree/syntax/kind_registry.hpp"

namespace syntree
{

namespace
{

/// First present child of `node`; throws if there is none
Element first_child(const Node * node)
{
  auto children = node->children();
  auto it = children.begin();
  if (it == children.end()) {
    throw TreeInvariantError(
      std::string(node->kind_name()) + " has no children and therefore no position");
  }
  return *it;
}

uint32_t element_full_width(Element e)
{
  if (const Token * token = e.token()) return token->full_width();
  return e.node()->full_width();
}

/// End-of-file token of the SourceFile at the top of `node`'s tree
const Token * end_of_file_token(const Node * node)
{
  const auto * file = dyn_cast<SourceFile>(node->root());
  if (file == nullptr) {
    throw TreeInvariantError(
      std::string(node->kind_name()) + " is not part of a tree rooted at a SourceFile");
  }
  const Token * eof = file->endOfFileToken().token();
  if (eof == nullptr) {
    throw TreeInvariantError("SourceFile has no end-of-file token");
  }
  return eof;
}

}  // namespace

std::string_view Node::kind_name() const noexcept { return to_string(kind_); }

// ============================================================================
// Navigation
// ============================================================================

const Node * Node::root() const noexcept
{
  const Node * node = this;
  while (node->parent_ != nullptr) {
    node = node->parent_;
  }
  return node;
}

const Node * Node::ancestor(NodeKind kind) const noexcept
{
  for (const Node * p = parent_; p != nullptr; p = p->parent_) {
    if (p->kind_ == kind) return p;
  }
  return nullptr;
}

// ============================================================================
// Slots
// ============================================================================

gsl::span<const SlotDesc> Node::schema() const noexcept { return child_slots(kind_); }

Element Node::slot(size_t index) const
{
  if (index >= slots_.size()) {
    throw std::out_of_range(
      std::string(kind_name()) + " has no slot " + std::to_string(index));
  }
  const SlotStorage & storage = slots_[index];
  return storage.empty() ? Element{} : storage[0];
}

gsl::span<const Element> Node::slot_list(size_t index) const
{
  if (index >= slots_.size()) {
    throw std::out_of_range(
      std::string(kind_name()) + " has no slot " + std::to_string(index));
  }
  return slots_[index];
}

std::vector<NamedSlot> Node::slots() const
{
  const gsl::span<const SlotDesc> descs = schema();
  std::vector<NamedSlot> result;
  result.reserve(descs.size());
  for (size_t i = 0; i < descs.size() && i < slots_.size(); ++i) {
    result.push_back(NamedSlot{descs[i].name, descs[i].arity, slots_[i]});
  }
  return result;
}

const Token * Node::first_token() const
{
  auto tokens = descendant_tokens();
  auto it = tokens.begin();
  return it == tokens.end() ? nullptr : *it;
}

const Token * Node::last_token() const
{
  const Token * last = nullptr;
  for (const Token * token : descendant_tokens()) {
    last = token;
  }
  return last;
}

// ============================================================================
// Positions
// ============================================================================

uint32_t Node::full_start() const
{
  const Element child = first_child(this);
  if (const Token * token = child.token()) return token->full_start;
  return child.node()->full_start();
}

uint32_t Node::start() const
{
  const Element child = first_child(this);
  if (const Token * token = child.token()) return token->start;
  return child.node()->start();
}

uint32_t Node::width() const
{
  uint32_t width = 0;
  bool first = true;
  for (const Element child : children()) {
    if (first) {
      const Token * token = child.token();
      width += token != nullptr ? token->width() : child.node()->width();
      first = false;
    } else {
      width += element_full_width(child);
    }
  }
  return width;
}

uint32_t Node::full_width() const
{
  uint32_t fullWidth = 0;
  for (const Element child : children()) {
    fullWidth += element_full_width(child);
  }
  return fullWidth;
}

uint32_t Node::end_position() const
{
  if (parent_ == nullptr) {
    if (kind_ != NodeKind::SourceFile) {
      throw TreeInvariantError(
        std::string(kind_name()) + " is detached and is not a SourceFile");
    }
    return end_of_file_token(this)->end();
  }

  auto siblings = parent_->child_nodes();
  for (auto it = siblings.begin(); it != siblings.end(); ++it) {
    if (*it != this) continue;
    ++it;
    return it != siblings.end() ? (*it)->full_start() : end_of_file_token(this)->full_start;
  }
  throw TreeInvariantError(
    std::string(kind_name()) + " is not among the children of its parent " +
    std::string(parent_->kind_name()));
}

// ============================================================================
// Point location
// ============================================================================

const Node * Node::descendant_node_at(uint32_t offset) const
{
  const std::vector<const Node *> nodes = descendant_nodes().to_vector();
  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
    const Node * node = *it;
    if (offset >= node->full_start() && offset < node->end_position()) {
      return node;
    }
  }
  return nullptr;
}

}  // namespace syntree
