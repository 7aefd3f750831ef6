// syntree/ast/ast.hpp - Concrete node classes of the reference grammar
//
// One class per AST_NODE in ast_nodes.def. Each class gets a `Slot` enum and
// a typed accessor per slot: single slots return an Element, list slots a
// span of Elements. The classes add no state to Node, so the same tree can be
// processed generically through Node or by kind through these classes.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "syntree/ast/ast_enums.hpp"
#include "syntree/ast/element.hpp"
#include "syntree/ast/node.hpp"

namespace syntree
{

// ============================================================================
// Slot Indices
// ============================================================================

#define AST_NODE(Class, Base) enum class Class##Slot : uint8_t {
#define AST_SLOT(Class, Name) Name,
#define AST_LIST(Class, Name) Name,
#define AST_NODE_END(Class) \
  SlotCount               \
  }                       \
  ;
#include "syntree/ast/ast_nodes.def"

// ============================================================================
// Node Classes
// ============================================================================

#define AST_NODE(Class, Base)                                                   \
  class Class final : public NodeBase<Class, Base, NodeKind::Class>             \
  {                                                                             \
  public:                                                                       \
    using Slot = Class##Slot;                                                   \
    static constexpr size_t k_slot_count = static_cast<size_t>(Slot::SlotCount); \
                                                                                \
    Class(gsl::span<const SlotStorage> slots, std::string_view fileContents) noexcept \
    : NodeBase(slots, fileContents)                                             \
    {                                                                           \
    }

#define AST_SLOT(Class, Name)                    \
  [[nodiscard]] Element Name() const             \
  {                                              \
    return slot(static_cast<size_t>(Slot::Name)); \
  }

#define AST_LIST(Class, Name)                         \
  [[nodiscard]] gsl::span<const Element> Name() const \
  {                                                   \
    return slot_list(static_cast<size_t>(Slot::Name)); \
  }

#define AST_NODE_END(Class) \
  }                         \
  ;

#include "syntree/ast/ast_nodes.def"

}  // namespace syntree
