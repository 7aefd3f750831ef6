// syntree/basic/error.hpp - Exceptions raised for malformed syntax trees
//
// A TreeInvariantError means the tree handed to syntree was built in
// violation of the construction contract (detached node, child slot holding
// something that is neither a Node nor a Token, node without tokens). It is
// an internal error of the producer, never a source diagnostic.
//
#pragma once

#include <stdexcept>
#include <string>

namespace syntree
{

class TreeInvariantError : public std::logic_error
{
public:
  explicit TreeInvariantError(const std::string & what) : std::logic_error(what) {}
  explicit TreeInvariantError(const char * what) : std::logic_error(what) {}
};

}  // namespace syntree
