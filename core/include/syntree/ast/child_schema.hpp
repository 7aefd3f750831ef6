// syntree/ast/child_schema.hpp - Named child slots per node kind
//
// The schema is a static table generated from ast_nodes.def; there is no
// runtime registration.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <vector>

#include "syntree/ast/ast_enums.hpp"

namespace syntree
{

/// Slots of `kind` in declaration order; empty for an unknown kind
[[nodiscard]] gsl::span<const SlotDesc> child_slots(NodeKind kind) noexcept;

[[nodiscard]] std::vector<std::string_view> child_slot_names(NodeKind kind);

/// Index of the slot called `name`, if `kind` has one
[[nodiscard]] std::optional<size_t> find_slot(NodeKind kind, std::string_view name) noexcept;

}  // namespace syntree
