// syntree/ast/tree_verifier.cpp - Construction contract checks
#include "syntree/ast/tree_verifier.hpp"

#include <fmt/core.h>

#include <string>
#include <vector>

#include "syntree/syntax/kind_registry.hpp"

namespace syntree
{
namespace
{

SourceRange token_range(const Token & token) noexcept
{
  return {token.full_start, token.end()};
}

class TreeVerifier
{
public:
  TreeVerifier(const SourceFile * file, const VerifyOptions & opts, DiagnosticBag & diags)
  : file_(file), opts_(opts), diags_(diags), document_(file->file_contents())
  {
  }

  void run()
  {
    check_parents(file_);
    const bool tokensOk = check_tokens();
    // Positions are undefined below malformed tokens or token-less nodes
    if (opts_.check_widths && tokensOk && diags_.count_code("V006") == 0) {
      check_widths(file_);
    }
  }

private:
  void check_parents(const Node * node)
  {
    for (const Element child : node->children()) {
      if (child.is_token()) continue;
      const Node * childNode = child.node();
      if (childNode->parent() != node) {
        diags_.report_error({}, fmt::format(
          "{} inside {} has a different parent", childNode->kind_name(), node->kind_name()))
          .with_code("V001");
      }
      check_parents(childNode);
    }
    if (node->first_token() == nullptr) {
      diags_.report_error({}, fmt::format("{} has no tokens", node->kind_name()))
        .with_code("V006");
    }
  }

  /// Returns false when a token is malformed, so later passes can skip positions
  bool check_tokens()
  {
    bool ok = true;
    const auto size = static_cast<uint32_t>(document_.size());
    uint32_t expected = 0;
    const Token * last = nullptr;

    for (const Token * token : file_->descendant_tokens()) {
      if (token->start < token->full_start || token->start > token->end()) {
        diags_.report_error(token_range(*token), fmt::format(
          "{} token has start {} outside [{}, {}]", to_string(token->kind), token->start,
          token->full_start, token->end()))
          .with_code("V002");
        ok = false;
      } else if (token->end() > size) {
        diags_.report_error(SourceRange::at(size), fmt::format(
          "{} token ends at {}, past the end of the buffer ({})", to_string(token->kind),
          token->end(), size))
          .with_code("V002");
        ok = false;
      }

      if (token->full_start > expected) {
        diags_.report_error(SourceRange(expected, token->full_start),
          fmt::format("{} bytes not covered by any token", token->full_start - expected))
          .with_code("V003");
      } else if (token->full_start < expected) {
        diags_.report_error(token_range(*token),
          fmt::format("{} token overlaps the previous token", to_string(token->kind)))
          .with_code("V003");
      }
      expected = token->end();
      last = token;
    }

    const Token * eof = file_->endOfFileToken().token();
    if (eof == nullptr || last != eof) {
      diags_.report_error(SourceRange::at(expected), "end-of-file token is not the last token")
        .with_code("V004");
    }
    if (expected != size) {
      diags_.report_error(SourceRange::at(expected), fmt::format(
        "tokens cover {} of {} bytes", expected, size))
        .with_code("V004");
    }
    return ok;
  }

  void check_widths(const Node * node)
  {
    const Token * first = node->first_token();
    if (first == nullptr) return;  // reported as V006

    if (node->start() != first->start || node->full_start() != first->full_start) {
      diags_.report_error(token_range(*first), fmt::format(
        "{} does not start at its first token", node->kind_name()))
        .with_code("V005");
    }
    if (node->full_width() != node->width() + first->trivia_width()) {
      diags_.report_error(SourceRange(node->full_start(), node->full_start() + node->full_width()),
        fmt::format(
          "{}: full width {} != width {} + trivia {}", node->kind_name(), node->full_width(),
          node->width(), first->trivia_width()))
        .with_code("V005");
    }

    for (const Node * child : node->child_nodes()) {
      check_widths(child);
    }
  }

  const SourceFile * file_;
  const VerifyOptions & opts_;
  DiagnosticBag & diags_;
  std::string_view document_;
};

}  // namespace

DiagnosticBag verify_tree(const SourceFile * file, const VerifyOptions & opts)
{
  DiagnosticBag diags;
  TreeVerifier(file, opts, diags).run();
  return diags;
}

}  // namespace syntree
