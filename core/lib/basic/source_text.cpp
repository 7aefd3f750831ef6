// syntree/basic/source_text.cpp - Source buffer and line lookup
#include "syntree/basic/source_text.hpp"

#include <algorithm>

namespace syntree
{

LineColumn SourceText::get_line_column(uint32_t offset) const noexcept
{
  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  // line_offsets_ always holds at least the entry for line 1 at offset 0
  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceText::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;  // drop '\n'
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceText::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }

  const uint32_t start = range.get_begin();
  uint32_t end = range.get_end();
  if (start >= content_.size()) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceText::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (range.is_invalid()) {
    return result;
  }

  result.start_byte = range.get_begin();
  result.end_byte = range.get_end();

  const LineColumn start_lc = get_line_column(result.start_byte);
  const LineColumn end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceText::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace syntree
