#include <gtest/gtest.h>

#include <rang.hpp>
#include <sstream>
#include <string>

#include "syntree/basic/diagnostic.hpp"
#include "syntree/basic/diagnostic_printer.hpp"
#include "syntree/basic/source_text.hpp"

using syntree::DiagnosticBag;
using syntree::DiagnosticPrinter;
using syntree::SourceRange;
using syntree::SourceText;

TEST(BasicDiagnostic, BuilderAddsOnDestruction)
{
  DiagnosticBag diags;
  {
    auto builder = diags.report_error(SourceRange(1, 3), "bad thing", "here");
    builder.with_code("V003");
    EXPECT_TRUE(diags.empty());
  }
  ASSERT_EQ(diags.size(), 1U);

  const auto & d = diags.all().front();
  EXPECT_EQ(d.code, "V003");
  EXPECT_EQ(d.message, "bad thing");
  EXPECT_EQ(d.label, "here");
  EXPECT_EQ(d.range, SourceRange(1, 3));
}

TEST(BasicDiagnostic, CountsByCode)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange(0, 1), "e1").with_code("V003");
  diags.report_error(SourceRange(2, 3), "e2").with_code("V003");
  diags.report_error(SourceRange(), "e3").with_code("V005");
  diags.report_error(SourceRange(0, 1), "parse error");

  EXPECT_EQ(diags.size(), 4U);
  EXPECT_EQ(diags.count_code("V003"), 2U);
  EXPECT_EQ(diags.count_code("V005"), 1U);
  EXPECT_EQ(diags.count_code("V001"), 0U);
  EXPECT_TRUE(diags.all()[3].code.empty());
}

TEST(BasicDiagnosticPrinter, PrintsLocationAndMarker)
{
  const SourceText source("sample.src", "x = 1\ny = ;\n");
  DiagnosticBag diags;
  diags.report_error(SourceRange(4, 5), "expected expression", "found Semicolon").with_code("P001");

  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(diags, source);

  EXPECT_EQ(
    out.str(),
    "error[P001]: expected expression\n"
    "  --> sample.src:1:5\n"
    "      |\n"
    "    1 | x = 1\n"
    "      |     ^ found Semicolon\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, RangelessDiagnosticBecomesNote)
{
  const SourceText source("abc\n");
  DiagnosticBag diags;
  diags.report_error(SourceRange(), "parent pointer mismatch", "under SourceFile").with_code("V001");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, source);

  EXPECT_EQ(
    out.str(),
    "error[V001]: parent pointer mismatch\n"
    "  --> <source>\n"
    "      |\n"
    "      |\n"
    "   = note: under SourceFile\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, OrdersByLocation)
{
  const SourceText source("abc\ndef\n");
  DiagnosticBag diags;
  diags.report_error(SourceRange(5, 6), "second");
  diags.report_error(SourceRange(0, 1), "first");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, source);

  const std::string text = out.str();
  const auto first = text.find("error: first");
  const auto second = text.find("error: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(BasicDiagnosticPrinter, ColorlessPrinterKeepsGlobalColorMode)
{
  rang::setControlMode(rang::control::Force);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  DiagnosticBag diags;
  diags.report_error(SourceRange(0, 1), "oops");
  printer.print_all(diags, SourceText("abc\n"));
  EXPECT_EQ(out.str().find('\033'), std::string::npos);

  std::ostringstream other;
  other << rang::fg::red;
  EXPECT_FALSE(other.str().empty());

  rang::setControlMode(rang::control::Auto);
}
