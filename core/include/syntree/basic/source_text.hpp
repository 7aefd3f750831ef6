// syntree/basic/source_text.hpp - Source buffer, byte ranges and line lookup
//
// All token offsets in a syntax tree are absolute byte offsets into one
// SourceText. The buffer is immutable once constructed.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace syntree
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A half-open byte range [begin, end) in a SourceText.
 *
 * A default-constructed range is invalid; diagnostics that are not tied to a
 * particular location use it.
 */
class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  /// Zero-width range at `offset`
  [[nodiscard]] static constexpr SourceRange at(uint32_t offset) noexcept
  {
    return {offset, offset};
  }

  [[nodiscard]] constexpr uint32_t get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset && begin_ <= end_;
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return is_valid() && offset >= begin_ && offset < end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_ - begin_ : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Source range with pre-computed line/column information, used when
 * rendering diagnostics.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceText - The buffer a syntax tree describes
// ============================================================================

/**
 * Owns the source bytes of one file plus a line-start table.
 *
 * The path is informational only (used in diagnostic headers); nothing here
 * touches the filesystem.
 */
class SourceText
{
public:
  SourceText() { build_line_table(); }

  explicit SourceText(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceText(std::filesystem::path path, std::string content)
  : path_(std::move(path)), content_(std::move(content))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_path() const noexcept { return path_; }
  [[nodiscard]] bool has_path() const noexcept { return !path_.empty(); }

  /// The whole buffer
  [[nodiscard]] std::string_view get_content() const noexcept { return content_; }

  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed). Offsets past the end clamp.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a 0-indexed line, without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Bytes covered by `range`, clamped to the buffer
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace syntree
