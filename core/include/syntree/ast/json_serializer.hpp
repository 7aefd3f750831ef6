// syntree/ast/json_serializer.hpp - JSON serialization for syntax trees
//
// Nodes serialize as {"<KindName>": {"<slotName>": value, ...}} where a value
// is a nested node, a token record, an array for list slots, or null for an
// absent single slot. Token records carry offsets only; the source buffer is
// never read. Objects keep slot declaration order (nlohmann::ordered_json).
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "syntree/ast/element.hpp"
#include "syntree/ast/node.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree
{

/// How much of a token's position a record carries
enum class TokenFormat : uint8_t {
  Full,     ///< {"kind", "fullStart", "start", "length"}
  Compact,  ///< {"kind", "textLength"}
};

struct SerializeOptions
{
  TokenFormat tokens = TokenFormat::Full;
};

[[nodiscard]] nlohmann::ordered_json to_json(const Token & token, const SerializeOptions & opts = {});

/**
 * Serialize a node and everything below it.
 *
 * @param node The node to serialize; nullptr serializes as null
 * @param opts Token verbosity
 */
[[nodiscard]] nlohmann::ordered_json to_json(const Node * node, const SerializeOptions & opts = {});

[[nodiscard]] nlohmann::ordered_json to_json(Element element, const SerializeOptions & opts = {});

/// to_json(node, opts).dump(indent)
[[nodiscard]] std::string to_json_string(
  const Node * node, const SerializeOptions & opts = {}, int indent = -1);

}  // namespace syntree
