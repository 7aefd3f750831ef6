// syntree/ast/node.hpp - Base class of every syntax node
//
// A Node stores nothing but its kind, its parent and its child slots. Spans,
// widths and text are derived from the tokens below it on demand, which keeps
// the tree lossless without storing redundant positions on interior nodes.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "syntree/ast/ast_enums.hpp"
#include "syntree/ast/element.hpp"
#include "syntree/ast/walker.hpp"
#include "syntree/basic/casting.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree
{

/// Storage of one slot: a single slot is a one-element span, a list slot any length
using SlotStorage = gsl::span<Element>;

/// A slot paired with its schema entry, as returned by Node::slots()
struct NamedSlot
{
  std::string_view name;
  SlotArity arity = SlotArity::Single;
  gsl::span<const Element> elements;

  [[nodiscard]] bool is_list() const noexcept { return arity == SlotArity::List; }

  /// Value of a single slot (null when absent)
  [[nodiscard]] Element value() const noexcept
  {
    return elements.empty() ? Element{} : elements[0];
  }
};

// ============================================================================
// Node
// ============================================================================

/**
 * Base class for all syntax nodes.
 *
 * Nodes are created and owned by an AstContext, which wires the parent
 * pointer when a node is placed in another node's slot. After construction
 * the tree is immutable.
 *
 * Position vocabulary:
 * - full_start: first byte of the node, including leading trivia
 * - start:      first byte of significant text
 * - width:      significant length (leading trivia of the first token excluded)
 * - full_width: total length of all tokens below the node
 */
class Node
{
public:
  // Non-copyable, non-movable (managed by AstContext)
  Node(const Node &) = delete;
  Node & operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node & operator=(Node &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind_; }

  /// Registry name of the kind, e.g. "IfStatement"
  [[nodiscard]] std::string_view kind_name() const noexcept;

  // ===========================================================================
  // Navigation
  // ===========================================================================

  [[nodiscard]] const Node * parent() const noexcept { return parent_; }

  /// Topmost ancestor (the node itself when detached)
  [[nodiscard]] const Node * root() const noexcept;

  /// Nearest strict ancestor of `kind`, or nullptr
  [[nodiscard]] const Node * ancestor(NodeKind kind) const noexcept;

  template <typename T>
  [[nodiscard]] const T * ancestor() const noexcept
  {
    for (const Node * p = parent_; p != nullptr; p = p->parent_) {
      if (isa<T>(p)) {
        return static_cast<const T *>(p);
      }
    }
    return nullptr;
  }

  // ===========================================================================
  // Slots
  // ===========================================================================

  /// Slot descriptors of this node's kind
  [[nodiscard]] gsl::span<const SlotDesc> schema() const noexcept;

  [[nodiscard]] size_t slot_count() const noexcept { return slots_.size(); }

  /// Value of single slot `index` (null when absent)
  [[nodiscard]] Element slot(size_t index) const;

  /// Elements of slot `index`; empty for an absent single slot
  [[nodiscard]] gsl::span<const Element> slot_list(size_t index) const;

  /// Every slot with its name, in declaration order
  [[nodiscard]] std::vector<NamedSlot> slots() const;

  // ===========================================================================
  // Traversal
  // ===========================================================================

  /// Direct children in slot order, list slots flattened, absent slots skipped
  [[nodiscard]] ChildElementRange children() const noexcept { return ChildElementRange(this); }
  [[nodiscard]] ChildNodeRange child_nodes() const noexcept { return ChildNodeRange(this); }
  [[nodiscard]] ChildTokenRange child_tokens() const noexcept { return ChildTokenRange(this); }

  /// Pre-order walk below this node. `descend` is asked once per node whether
  /// to enter its subtree. Iterators share ownership of `descend` and may
  /// outlive the returned range.
  [[nodiscard]] DescendantElementRange descendants(DescendPredicate descend = {}) const
  {
    return DescendantElementRange(this, std::move(descend));
  }
  [[nodiscard]] DescendantNodeRange descendant_nodes(DescendPredicate descend = {}) const
  {
    return DescendantNodeRange(this, std::move(descend));
  }
  [[nodiscard]] DescendantTokenRange descendant_tokens(DescendPredicate descend = {}) const
  {
    return DescendantTokenRange(this, std::move(descend));
  }

  /// First / last token of the subtree, or nullptr when it has none
  [[nodiscard]] const Token * first_token() const;
  [[nodiscard]] const Token * last_token() const;

  // ===========================================================================
  // Positions
  // ===========================================================================

  /// Throws TreeInvariantError if the node has no children
  [[nodiscard]] uint32_t full_start() const;
  [[nodiscard]] uint32_t start() const;

  [[nodiscard]] uint32_t width() const;
  [[nodiscard]] uint32_t full_width() const;

  /**
   * Offset where the node's extent ends.
   *
   * This is the full_start of the next node sibling; a last child extends to
   * the end-of-file token's full_start, so extents of nested nodes overlap.
   * The root SourceFile ends with its end-of-file token. Throws
   * TreeInvariantError for a detached node that is not a SourceFile.
   */
  [[nodiscard]] uint32_t end_position() const;

  // ===========================================================================
  // Text
  // ===========================================================================

  /// The whole buffer the tree was built from
  [[nodiscard]] std::string_view file_contents() const noexcept { return file_contents_; }

  /// Source text without the leading trivia of the first token
  [[nodiscard]] std::string text() const;

  /// Source text including all trivia
  [[nodiscard]] std::string full_text() const;

  [[nodiscard]] std::string_view leading_trivia_text() const;

  // ===========================================================================
  // Point location
  // ===========================================================================

  /**
   * Innermost descendant whose [full_start, end_position) contains `offset`,
   * or nullptr.
   *
   * Descendants are scanned in reverse pre-order and the first match wins,
   * so of two nodes with identical extents the later one is returned.
   */
  [[nodiscard]] const Node * descendant_node_at(uint32_t offset) const;

protected:
  Node(NodeKind kind, gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept
  : kind_(kind), slots_(slots), file_contents_(fileContents)
  {
  }
  ~Node() = default;  // Non-virtual, protected: prevents polymorphic delete

private:
  friend class AstContext;

  NodeKind kind_;
  const Node * parent_ = nullptr;
  gsl::span<const SlotStorage> slots_;
  std::string_view file_contents_;
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const Node * node) { return node->get_kind() == K; }

protected:
  NodeBase(gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept
  : Base(K, slots, fileContents)
  {
  }
};

// ============================================================================
// Category Base Classes
// ============================================================================

/// SourceFile and the supporting kinds derive from Node directly
class Statement : public Node
{
public:
  static bool classof(const Node * node) { return is_statement_kind(node->get_kind()); }

protected:
  Statement(NodeKind k, gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept
  : Node(k, slots, fileContents)
  {
  }
};

/// Declarations appear in statement position
class Declaration : public Statement
{
public:
  static bool classof(const Node * node) { return is_declaration_kind(node->get_kind()); }

protected:
  Declaration(NodeKind k, gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept
  : Statement(k, slots, fileContents)
  {
  }
};

class Expression : public Node
{
public:
  static bool classof(const Node * node) { return is_expression_kind(node->get_kind()); }

protected:
  Expression(NodeKind k, gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept
  : Node(k, slots, fileContents)
  {
  }
};

// ============================================================================
// Casting an Element
// ============================================================================

template <typename T>
[[nodiscard]] inline bool isa(Element e) noexcept
{
  return isa<T>(e.node());
}

/// Node of type T held by `e`, or nullptr
template <typename T>
[[nodiscard]] inline const T * dyn_cast(Element e) noexcept
{
  return dyn_cast<T>(e.node());
}

template <typename T>
[[nodiscard]] inline const T * cast(Element e) noexcept
{
  return cast<T>(e.node());
}

}  // namespace syntree
