// syntree/ast/ast_enums.hpp - Node kinds and child slot descriptors
//
// NodeKind is generated from ast_nodes.def. Kinds are grouped by category so
// category tests are range checks.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace syntree
{

enum class NodeKind : uint8_t {
#define AST_NODE(Class, Base) Class,
#include "syntree/ast/ast_nodes.def"
};

// ============================================================================
// Child slot descriptors
// ============================================================================

/// Whether a slot holds one (possibly absent) child or an ordered list
enum class SlotArity : uint8_t {
  Single,
  List,
};

/// One named child slot of a node kind, in declaration (source) order
struct SlotDesc
{
  std::string_view name;
  SlotArity arity;

  [[nodiscard]] constexpr bool is_list() const noexcept { return arity == SlotArity::List; }
};

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_stmt_kind = NodeKind::CompoundStatement;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ErrorStatement;

inline constexpr NodeKind k_first_decl_kind = NodeKind::FunctionDeclaration;
inline constexpr NodeKind k_last_decl_kind = NodeKind::VariableDeclaration;

inline constexpr NodeKind k_first_expr_kind = NodeKind::NameExpression;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpression;

}  // namespace detail

/// Statements, including declarations (which appear in statement position)
[[nodiscard]] constexpr bool is_statement_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_decl_kind;
}

[[nodiscard]] constexpr bool is_declaration_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

[[nodiscard]] constexpr bool is_expression_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

}  // namespace syntree
