// syntree/test_support/parse_helpers.hpp - helpers for unit tests
//
// Lex and parse a source string with the reference grammar into an owning
// bundle of context, tree and diagnostics.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "syntree/ast/ast.hpp"
#include "syntree/ast/ast_context.hpp"
#include "syntree/basic/diagnostic.hpp"
#include "syntree/test_support/lexer.hpp"
#include "syntree/test_support/parser.hpp"

namespace syntree::test_support
{

struct TestParseUnit
{
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  SourceFile * file = nullptr;

  [[nodiscard]] const SourceText & source() const noexcept { return ast->source(); }
  [[nodiscard]] std::string_view text() const noexcept { return ast->file_contents(); }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.src")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>(SourceText(virtual_path, std::move(src)));

  Lexer lexer(out.ast->file_contents(), out.diags);
  Parser parser(*out.ast, out.diags, lexer.lex_all());
  out.file = parser.parse_source_file();
  return out;
}

}  // namespace syntree::test_support
