// syntree/ast/json_serializer.cpp - JSON serialization implementation
//
#include "syntree/ast/json_serializer.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "syntree/syntax/kind_registry.hpp"

namespace syntree
{

using json = nlohmann::ordered_json;

json to_json(const Token & token, const SerializeOptions & opts)
{
  const std::string kind(to_string(token.kind));
  if (opts.tokens == TokenFormat::Compact) {
    return json{{"kind", kind}, {"textLength", token.width()}};
  }
  return json{
    {"kind", kind},
    {"fullStart", token.full_start},
    {"start", token.start},
    {"length", token.length}};
}

json to_json(Element element, const SerializeOptions & opts)
{
  if (const Token * token = element.token()) return to_json(*token, opts);
  if (const Node * node = element.node()) return to_json(node, opts);
  return nullptr;
}

json to_json(const Node * node, const SerializeOptions & opts)
{
  if (node == nullptr) return nullptr;

  json fields = json::object();
  for (const NamedSlot & slot : node->slots()) {
    const std::string name(slot.name);
    if (slot.is_list()) {
      json items = json::array();
      for (const Element & e : slot.elements) {
        items.push_back(to_json(e, opts));
      }
      fields[name] = std::move(items);
    } else {
      fields[name] = to_json(slot.value(), opts);
    }
  }

  json result = json::object();
  result[std::string(node->kind_name())] = std::move(fields);
  return result;
}

std::string to_json_string(const Node * node, const SerializeOptions & opts, int indent)
{
  return to_json(node, opts).dump(indent);
}

}  // namespace syntree
