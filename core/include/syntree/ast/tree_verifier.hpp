// syntree/ast/tree_verifier.hpp - On-demand check of the construction contract
//
// A tree producer promises that tokens tile the buffer in document order and
// that parent pointers match containment. verify_tree checks those promises
// and reports every violation as a diagnostic instead of throwing:
//
//   V001  child's parent pointer does not point at its container
//   V002  malformed token (start outside its span, or span outside the buffer)
//   V003  gap or overlap between consecutive tokens
//   V004  tokens do not cover the whole buffer, or end-of-file is not last
//   V005  width composition does not hold for a node
//   V006  node without any token
//
#pragma once

#include "syntree/ast/ast.hpp"
#include "syntree/basic/diagnostic.hpp"

namespace syntree
{

struct VerifyOptions
{
  bool check_widths = true;  ///< Run the V005 pass (walks every subtree)
};

[[nodiscard]] DiagnosticBag verify_tree(const SourceFile * file, const VerifyOptions & opts = {});

}  // namespace syntree
