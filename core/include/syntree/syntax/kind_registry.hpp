// syntree/syntax/kind_registry.hpp - Kind id <-> name lookup
//
// Read-only tables mapping token and node kinds to the names used in
// serialized trees and dumps, and back. Both are generated from the .def
// files, so ids and names cannot drift apart.
//
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

#include "syntree/ast/ast_enums.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree
{

inline constexpr std::string_view k_unknown_token_kind_name = "Unknown Token Kind";
inline constexpr std::string_view k_unknown_node_kind_name = "Unknown Node Kind";

namespace detail
{

inline constexpr std::string_view k_token_kind_names[] = {
#define TOKEN_KIND(Kind) #Kind,
#include "syntree/syntax/token_kinds.def"
};

inline constexpr std::string_view k_node_kind_names[] = {
#define AST_NODE(Class, Base) #Class,
#include "syntree/ast/ast_nodes.def"
};

}  // namespace detail

inline constexpr size_t k_token_kind_count = std::size(detail::k_token_kind_names);
inline constexpr size_t k_node_kind_count = std::size(detail::k_node_kind_names);

/// Registry name of a token kind; out-of-range ids map to "Unknown Token Kind"
[[nodiscard]] constexpr std::string_view to_string(TokenKind kind) noexcept
{
  const auto index = static_cast<size_t>(kind);
  return index < k_token_kind_count ? detail::k_token_kind_names[index] : k_unknown_token_kind_name;
}

/// Registry name of a node kind; out-of-range ids map to "Unknown Node Kind"
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  const auto index = static_cast<size_t>(kind);
  return index < k_node_kind_count ? detail::k_node_kind_names[index] : k_unknown_node_kind_name;
}

[[nodiscard]] constexpr std::optional<TokenKind> token_kind_from_name(std::string_view name) noexcept
{
  for (size_t i = 0; i < k_token_kind_count; ++i) {
    if (detail::k_token_kind_names[i] == name) {
      return static_cast<TokenKind>(i);
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr std::optional<NodeKind> node_kind_from_name(std::string_view name) noexcept
{
  for (size_t i = 0; i < k_node_kind_count; ++i) {
    if (detail::k_node_kind_names[i] == name) {
      return static_cast<NodeKind>(i);
    }
  }
  return std::nullopt;
}

}  // namespace syntree
