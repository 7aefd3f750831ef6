// syntree/ast/element.hpp - Child value of a node slot
//
// An Element is what a slot holds: nothing, a Node or a Token. It is a
// pointer-sized tagged union so slot storage stays trivially destructible and
// can live in the AstContext arena.
//
#pragma once

#include <cstddef>
#include <cstdint>

namespace syntree
{

class Node;
class AstContext;
struct Token;

class Element
{
public:
  enum class Tag : uint8_t {
    None,
    Node,
    Token,
  };

  constexpr Element() noexcept = default;
  constexpr Element(std::nullptr_t) noexcept {}  // NOLINT(google-explicit-constructor)
  constexpr Element(Node * node) noexcept        // NOLINT(google-explicit-constructor)
  : tag_(node ? Tag::Node : Tag::None), node_(node)
  {
  }
  constexpr Element(const Token * token) noexcept  // NOLINT(google-explicit-constructor)
  : tag_(token ? Tag::Token : Tag::None), token_(token)
  {
  }

  [[nodiscard]] constexpr Tag tag() const noexcept { return tag_; }

  [[nodiscard]] constexpr bool is_null() const noexcept { return tag_ == Tag::None; }
  [[nodiscard]] constexpr bool is_node() const noexcept { return tag_ == Tag::Node; }
  [[nodiscard]] constexpr bool is_token() const noexcept { return tag_ == Tag::Token; }

  /// The node, or nullptr if this element is not a node
  [[nodiscard]] constexpr const Node * node() const noexcept
  {
    return tag_ == Tag::Node ? node_ : nullptr;
  }

  /// The token, or nullptr if this element is not a token
  [[nodiscard]] constexpr const Token * token() const noexcept
  {
    return tag_ == Tag::Token ? token_ : nullptr;
  }

  explicit constexpr operator bool() const noexcept { return tag_ != Tag::None; }

  [[nodiscard]] constexpr bool operator==(const Element & other) const noexcept
  {
    if (tag_ != other.tag_) return false;
    switch (tag_) {
      case Tag::Node:
        return node_ == other.node_;
      case Tag::Token:
        return token_ == other.token_;
      case Tag::None:
        break;
    }
    return true;
  }
  [[nodiscard]] constexpr bool operator!=(const Element & other) const noexcept
  {
    return !(*this == other);
  }

private:
  friend class AstContext;

  /// Only the context may reach the mutable node, to wire its parent
  [[nodiscard]] constexpr Node * mutable_node() const noexcept
  {
    return tag_ == Tag::Node ? node_ : nullptr;
  }

  Tag tag_ = Tag::None;
  union {
    Node * node_ = nullptr;
    const Token * token_;
  };
};

}  // namespace syntree
