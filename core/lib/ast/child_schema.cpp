// syntree/ast/child_schema.cpp - Static slot tables
#include "syntree/ast/child_schema.hpp"

namespace syntree
{

namespace
{

#define AST_NODE(Class, Base) constexpr SlotDesc k_##Class##_slots[] = {
#define AST_SLOT(Class, Name) {#Name, SlotArity::Single},
#define AST_LIST(Class, Name) {#Name, SlotArity::List},
#define AST_NODE_END(Class) \
  }                         \
  ;
#include "syntree/ast/ast_nodes.def"

}  // namespace

gsl::span<const SlotDesc> child_slots(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Base) \
  case NodeKind::Class:       \
    return gsl::span<const SlotDesc>(k_##Class##_slots);
#include "syntree/ast/ast_nodes.def"
  }
  return {};
}

std::vector<std::string_view> child_slot_names(NodeKind kind)
{
  std::vector<std::string_view> names;
  for (const SlotDesc & desc : child_slots(kind)) {
    names.push_back(desc.name);
  }
  return names;
}

std::optional<size_t> find_slot(NodeKind kind, std::string_view name) noexcept
{
  const auto slots = child_slots(kind);
  for (size_t i = 0; i < slots.size(); ++i) {
    if (slots[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace syntree
