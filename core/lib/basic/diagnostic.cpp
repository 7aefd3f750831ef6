// syntree/basic/diagnostic.cpp
#include "syntree/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace syntree
{

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label)
{
  return {*this, Diagnostic{std::string(), std::move(message), range, std::move(label)}};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

size_t DiagnosticBag::count_code(std::string_view code) const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [&](const Diagnostic & d) {
      return d.code == code;
    }));
}

}  // namespace syntree
