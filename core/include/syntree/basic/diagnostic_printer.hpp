// syntree/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "syntree/basic/diagnostic.hpp"
#include "syntree/basic/source_text.hpp"

namespace syntree
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[V003]: gap between tokens
 *     --> sample.src:3:7
 *      |
 *    3 | x = y ;
 *      |       ^ 2 bytes not covered by any token
 *
 * Colors are written only when `use_color` is set; rang's global control
 * mode is left alone.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colors to `os`
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceText & source);

  /// Print every diagnostic of the bag, ordered by primary location
  void print_all(const DiagnosticBag & diags, const SourceText & source);

private:
  void print_header(const Diagnostic & diag);
  void print_marker(const Diagnostic & diag, const SourceText & source);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace syntree
