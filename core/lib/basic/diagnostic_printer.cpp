// syntree/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "syntree/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace syntree
{
namespace
{

/// Tabs become 4 spaces so markers line up with the echoed line.
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

size_t visual_column(std::string_view line, uint32_t column)
{
  size_t visual = 0;
  for (size_t i = 0; i + 1 < column && i < line.size(); ++i) {
    visual += (line[i] == '\t') ? 4 : 1;
  }
  return visual;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceText & source)
{
  const std::string filename = source.has_path() ? source.get_path().string() : "<source>";
  const FullSourceRange primary = source.get_full_range(diag.range);

  print_header(diag);

  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary.start_line, primary.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  print_marker(diag, source);

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceText & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->range.get_begin() < b->range.get_begin();
  });

  for (const Diagnostic * d : sorted) {
    print(*d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "error{}: {}\n", code, diag.message);
    return;
  }
  os_ << rang::style::bold << rang::fg::red << "error" << code << rang::fg::reset << ": "
      << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_marker(const Diagnostic & diag, const SourceText & source)
{
  const FullSourceRange fr = source.get_full_range(diag.range);
  if (!fr.is_valid()) {
    if (!diag.label.empty()) {
      print_trailer("note", diag.label);
    }
    return;
  }

  const std::string_view line = source.get_line(fr.start_line - 1);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fr.start_line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Multi-line and zero-width ranges get a single-column marker
  const size_t start = visual_column(line, fr.start_column);
  size_t width = 1;
  if (fr.end_line == fr.start_line && fr.end_column > fr.start_column) {
    width = visual_column(line, fr.end_column) - start;
  }

  fmt::print(os_, "      | {}", std::string(start, ' '));
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(std::max<size_t>(width, 1), '^'));
  if (!diag.label.empty()) {
    fmt::print(os_, " {}", diag.label);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace syntree
