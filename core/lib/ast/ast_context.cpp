// syntree/ast/ast_context.cpp - Slot validation and parent wiring
#include "syntree/ast/ast_context.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "syntree/ast/child_schema.hpp"
#include "syntree/syntax/kind_registry.hpp"

namespace syntree
{

namespace
{

[[noreturn]] void throw_slot_error(NodeKind kind, std::string_view slot, const std::string & what)
{
  std::string msg(to_string(kind));
  if (!slot.empty()) {
    msg += '.';
    msg += slot;
  }
  msg += ": ";
  msg += what;
  throw std::invalid_argument(msg);
}

}  // namespace

gsl::span<const SlotStorage> AstContext::build_slots(
  NodeKind kind, std::initializer_list<SlotInit> slots)
{
  const gsl::span<const SlotDesc> schema = child_slots(kind);
  if (slots.size() != schema.size()) {
    throw_slot_error(
      kind, {},
      "expected " + std::to_string(schema.size()) + " slot initializers, got " +
        std::to_string(slots.size()));
  }

  std::vector<const Node *> seen;
  auto check_child = [&](Element e, std::string_view slotName) {
    const Node * child = e.node();
    if (child == nullptr) return;
    if (child->parent_ != nullptr) {
      throw_slot_error(kind, slotName, "child node already has a parent");
    }
    if (std::find(seen.begin(), seen.end(), child) != seen.end()) {
      throw_slot_error(kind, slotName, "child node appears twice");
    }
    seen.push_back(child);
  };

  const gsl::span<SlotStorage> storage = allocate_array<SlotStorage>(schema.size());

  size_t index = 0;
  for (const SlotInit & init : slots) {
    const SlotDesc & desc = schema[index];

    if (desc.is_list()) {
      if (!init.is_list()) {
        // A null initializer is accepted as an empty list
        if (!init.single().is_null()) {
          throw_slot_error(kind, desc.name, "list slot initialized with a single element");
        }
      } else {
        const std::vector<Element> & list = init.list();
        const gsl::span<Element> elements = allocate_array<Element>(list.size());
        for (size_t i = 0; i < list.size(); ++i) {
          if (list[i].is_null()) {
            throw_slot_error(kind, desc.name, "null entry in list slot");
          }
          check_child(list[i], desc.name);
          elements[i] = list[i];
        }
        storage[index] = elements;
      }
    } else {
      if (init.is_list()) {
        throw_slot_error(kind, desc.name, "single slot initialized with a list");
      }
      const Element value = init.single();
      if (!value.is_null()) {
        check_child(value, desc.name);
        const gsl::span<Element> element = allocate_array<Element>(1);
        element[0] = value;
        storage[index] = element;
      }
    }
    ++index;
  }

  return storage;
}

void AstContext::attach_children(Node * parent) noexcept
{
  for (const SlotStorage & slot : parent->slots_) {
    for (const Element & e : slot) {
      if (Node * child = e.mutable_node()) {
        child->parent_ = parent;
      }
    }
  }
}

}  // namespace syntree
