// syntree/basic/diagnostic.hpp - Errors reported by the tree verifier and the reference parser
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "syntree/basic/source_text.hpp"

namespace syntree
{

/// One error anchored at a byte range of the buffer.
/// `range` is invalid when the error concerns the tree shape rather than text.
struct Diagnostic
{
  std::string code;  // e.g. "V003", empty for parse errors
  std::string message;
  SourceRange range;
  std::string label;  // printed next to the marker
};

class DiagnosticBag;

/**
 * Adds its diagnostic to the bag when destroyed, so a code can be chained on.
 *
 * @code
 *   diags.report_error(range, "gap between tokens").with_code("V003");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(SourceRange range, std::string message, std::string label = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  /// Number of diagnostics carrying `code`
  [[nodiscard]] size_t count_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace syntree
