// syntree/basic/casting.hpp - LLVM-style RTTI casting for syntax nodes
//
// Works with any class hierarchy implementing a static `classof` predicate.
// Every syntax node class gets one from NodeBase, category bases (Statement,
// Expression, Declaration) test a NodeKind range.
//
// Usage:
//   if (isa<IfStatement>(node)) { ... }
//   const auto* stmt = cast<IfStatement>(node);          // asserts on failure
//   if (const auto* call = dyn_cast<CallExpression>(node)) { ... }  // nullptr on failure
//
// Overloads taking an Element (a child slot value) are provided in
// syntree/ast/node.hpp, next to Element's definition of node().
//
#pragma once

#include <cassert>
#include <type_traits>

namespace syntree
{

namespace detail
{

/// Check if T has a classof static method accepting `const From *`
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// True if `node` is non-null and of dynamic type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/**
 * Cast to T. The node must be non-null and of type T (checked by assert in
 * debug builds only). Use dyn_cast when the type is not known.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Cast to T, or nullptr if `node` is null or not a T.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

/// Like cast, but passes nullptr through.
template <typename T, typename From>
[[nodiscard]] inline const T * cast_or_null(const From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

}  // namespace syntree
