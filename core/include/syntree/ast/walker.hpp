// syntree/ast/walker.hpp - Lazy child and descendant traversal
//
// Every traversal is an input range whose iterators own an explicit cursor
// stack. Ranges are cheap to create and independent of each other, so calling
// a traversal twice restarts it.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "syntree/ast/element.hpp"

namespace syntree
{

class Node;

/// Which elements a traversal yields
enum class ElementFilter : uint8_t {
  NodesAndTokens,
  Nodes,
  Tokens,
};

/**
 * Decides whether a descendant traversal enters a node's subtree.
 *
 * Evaluated once per visited node, never for tokens. An empty predicate
 * descends everywhere.
 */
using DescendPredicate = std::function<bool(const Node *)>;

template <ElementFilter F>
struct FilterTraits;

template <>
struct FilterTraits<ElementFilter::NodesAndTokens>
{
  using value_type = Element;
  static constexpr value_type project(Element e) noexcept { return e; }
};

template <>
struct FilterTraits<ElementFilter::Nodes>
{
  using value_type = const Node *;
  static constexpr value_type project(Element e) noexcept { return e.node(); }
};

template <>
struct FilterTraits<ElementFilter::Tokens>
{
  using value_type = const Token *;
  static constexpr value_type project(Element e) noexcept { return e.token(); }
};

namespace detail
{

/// Position within one node's slots; list slots are flattened in place
class ChildCursor
{
public:
  ChildCursor() = default;
  explicit ChildCursor(const Node * node) noexcept : node_(node) {}

  /// Next present child in slot order, or a null element once exhausted.
  /// Throws TreeInvariantError on an element with an unknown tag.
  Element next();

private:
  const Node * node_ = nullptr;
  size_t slot_ = 0;
  size_t index_ = 0;
};

class ChildWalker
{
public:
  ChildWalker() = default;
  ChildWalker(const Node * parent, ElementFilter filter);

  void advance();

  [[nodiscard]] Element current() const noexcept { return current_; }

private:
  ChildCursor cursor_;
  ElementFilter filter_ = ElementFilter::NodesAndTokens;
  Element current_;
};

/**
 * Pre-order walk below a root node.
 *
 * A yielded node is held as pending; its predicate runs on the next advance,
 * so a consumer that stops early never pays for it. In Tokens mode nodes are
 * not yielded and the predicate runs when the node is reached.
 */
class DescendantWalker
{
public:
  DescendantWalker() = default;
  DescendantWalker(const Node * root, ElementFilter filter, const DescendPredicate * predicate);

  void advance();

  [[nodiscard]] Element current() const noexcept { return current_; }

private:
  [[nodiscard]] bool should_descend(const Node * node) const;

  std::vector<ChildCursor> stack_;
  const Node * pending_ = nullptr;
  ElementFilter filter_ = ElementFilter::NodesAndTokens;
  const DescendPredicate * predicate_ = nullptr;
  Element current_;
};

}  // namespace detail

// ============================================================================
// Child traversal
// ============================================================================

template <ElementFilter F>
class ChildIterator
{
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = typename FilterTraits<F>::value_type;
  using difference_type = std::ptrdiff_t;
  using pointer = void;
  using reference = value_type;

  ChildIterator() = default;
  explicit ChildIterator(const Node * parent) : walker_(parent, F) {}

  reference operator*() const { return FilterTraits<F>::project(walker_.current()); }

  ChildIterator & operator++()
  {
    walker_.advance();
    return *this;
  }

  ChildIterator operator++(int)
  {
    ChildIterator tmp = *this;
    walker_.advance();
    return tmp;
  }

  bool operator==(const ChildIterator & other) const
  {
    return walker_.current() == other.walker_.current();
  }
  bool operator!=(const ChildIterator & other) const { return !(*this == other); }

private:
  detail::ChildWalker walker_;
};

template <ElementFilter F>
class ChildRange
{
public:
  using iterator = ChildIterator<F>;
  using value_type = typename FilterTraits<F>::value_type;

  explicit ChildRange(const Node * parent) noexcept : parent_(parent) {}

  [[nodiscard]] iterator begin() const { return iterator(parent_); }
  [[nodiscard]] iterator end() const { return iterator(); }

  [[nodiscard]] bool empty() const { return begin() == end(); }

  [[nodiscard]] std::vector<value_type> to_vector() const
  {
    return std::vector<value_type>(begin(), end());
  }

private:
  const Node * parent_;
};

// ============================================================================
// Descendant traversal
// ============================================================================

template <ElementFilter F>
class DescendantIterator
{
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = typename FilterTraits<F>::value_type;
  using difference_type = std::ptrdiff_t;
  using pointer = void;
  using reference = value_type;

  DescendantIterator() = default;
  DescendantIterator(const Node * root, std::shared_ptr<const DescendPredicate> predicate)
  : predicate_(std::move(predicate)), walker_(root, F, predicate_.get())
  {
  }

  reference operator*() const { return FilterTraits<F>::project(walker_.current()); }

  DescendantIterator & operator++()
  {
    walker_.advance();
    return *this;
  }

  DescendantIterator operator++(int)
  {
    DescendantIterator tmp = *this;
    walker_.advance();
    return tmp;
  }

  bool operator==(const DescendantIterator & other) const
  {
    return walker_.current() == other.walker_.current();
  }
  bool operator!=(const DescendantIterator & other) const { return !(*this == other); }

private:
  std::shared_ptr<const DescendPredicate> predicate_;  // must precede walker_
  detail::DescendantWalker walker_;
};

/// The predicate is shared with every iterator, so iterators stay valid
/// after the range itself is destroyed.
template <ElementFilter F>
class DescendantRange
{
public:
  using iterator = DescendantIterator<F>;
  using value_type = typename FilterTraits<F>::value_type;

  DescendantRange(const Node * root, DescendPredicate predicate)
  : root_(root)
  {
    if (predicate) {
      predicate_ = std::make_shared<const DescendPredicate>(std::move(predicate));
    }
  }

  [[nodiscard]] iterator begin() const { return iterator(root_, predicate_); }
  [[nodiscard]] iterator end() const { return iterator(); }

  [[nodiscard]] std::vector<value_type> to_vector() const
  {
    return std::vector<value_type>(begin(), end());
  }

private:
  const Node * root_;
  std::shared_ptr<const DescendPredicate> predicate_;
};

using ChildElementRange = ChildRange<ElementFilter::NodesAndTokens>;
using ChildNodeRange = ChildRange<ElementFilter::Nodes>;
using ChildTokenRange = ChildRange<ElementFilter::Tokens>;

using DescendantElementRange = DescendantRange<ElementFilter::NodesAndTokens>;
using DescendantNodeRange = DescendantRange<ElementFilter::Nodes>;
using DescendantTokenRange = DescendantRange<ElementFilter::Tokens>;

}  // namespace syntree
