#include <gtest/gtest.h>

#include <string>

#include "syntree/basic/source_text.hpp"

using syntree::SourceRange;
using syntree::SourceText;

TEST(BasicSourceText, LineColumnLookup)
{
  const SourceText text("ab\ncd\n\nxyz");

  EXPECT_EQ(text.get_line_count(), 4U);

  auto lc = text.get_line_column(0);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 1U);

  lc = text.get_line_column(4);  // 'd'
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 2U);

  lc = text.get_line_column(6);  // empty third line
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 1U);

  // Offsets past the end clamp to the end
  lc = text.get_line_column(1000);
  EXPECT_EQ(lc.line, 4U);
  EXPECT_EQ(lc.column, 4U);
}

TEST(BasicSourceText, LinesDropTerminators)
{
  const SourceText text("first\r\nsecond\nthird");

  EXPECT_EQ(text.get_line(0), "first");
  EXPECT_EQ(text.get_line(1), "second");
  EXPECT_EQ(text.get_line(2), "third");
  EXPECT_EQ(text.get_line(3), "");
}

TEST(BasicSourceText, SliceClampsToBuffer)
{
  const SourceText text("hello world");

  EXPECT_EQ(text.get_slice(SourceRange(6, 11)), "world");
  EXPECT_EQ(text.get_slice(SourceRange(6, 100)), "world");
  EXPECT_EQ(text.get_slice(SourceRange(50, 60)), "");
  EXPECT_EQ(text.get_slice(SourceRange()), "");
}

TEST(BasicSourceText, FullRangeSpansLines)
{
  const SourceText text("a\nbcd\ne");
  const auto fr = text.get_full_range(SourceRange(3, 7));

  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 2U);
  EXPECT_EQ(fr.end_line, 3U);
  EXPECT_EQ(fr.end_column, 2U);
  EXPECT_EQ(fr.to_source_range(), SourceRange(3, 7));

  EXPECT_FALSE(text.get_full_range(SourceRange()).is_valid());
}

TEST(BasicSourceText, PathIsInformational)
{
  const SourceText anonymous("x");
  EXPECT_FALSE(anonymous.has_path());

  const SourceText named("sample.src", "x");
  EXPECT_TRUE(named.has_path());
  EXPECT_EQ(named.get_path().string(), "sample.src");
  EXPECT_EQ(named.get_content(), "x");
}

TEST(BasicSourceRange, ValidityAndContainment)
{
  const SourceRange r(2, 5);
  EXPECT_TRUE(r.is_valid());
  EXPECT_EQ(r.size(), 3U);
  EXPECT_TRUE(r.contains(2));
  EXPECT_TRUE(r.contains(4));
  EXPECT_FALSE(r.contains(5));

  const SourceRange empty = SourceRange::at(7);
  EXPECT_TRUE(empty.is_valid());
  EXPECT_EQ(empty.size(), 0U);
  EXPECT_FALSE(empty.contains(7));

  EXPECT_TRUE(SourceRange().is_invalid());
  EXPECT_TRUE(SourceRange(5, 2).is_invalid());
}
