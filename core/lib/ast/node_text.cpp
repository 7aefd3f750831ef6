// syntree/ast/node_text.cpp - Text of a node, recovered from its tokens
#include <string>

#include "syntree/ast/node.hpp"

namespace syntree
{

std::string Node::text() const
{
  std::string result;
  bool first = true;
  for (const Token * token : descendant_tokens()) {
    if (first) {
      result.append(token->text(file_contents_));
      first = false;
    } else {
      result.append(token->full_text(file_contents_));
    }
  }
  return result;
}

std::string Node::full_text() const
{
  std::string result;
  for (const Token * token : descendant_tokens()) {
    result.append(token->full_text(file_contents_));
  }
  return result;
}

std::string_view Node::leading_trivia_text() const
{
  const Token * token = first_token();
  return token != nullptr ? token->leading_trivia(file_contents_) : std::string_view{};
}

}  // namespace syntree
