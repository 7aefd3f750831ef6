// syntree/syntax/token.hpp - Leaf record of a syntax tree
#pragma once

#include <cstdint>
#include <string_view>

namespace syntree
{

enum class TokenKind : uint8_t {
#define TOKEN_KIND(Kind) Kind,
#include "syntree/syntax/token_kinds.def"
};

/**
 * A lexical unit: where it starts (with and without leading trivia) and how
 * many bytes it spans in total.
 *
 *   full_start          start                 full_start + length
 *   |<- leading trivia ->|<- significant text ->|
 *
 * A Token stores no text. Every text accessor takes the buffer the offsets
 * were computed against; the producer guarantees
 * `full_start <= start <= full_start + length`.
 */
struct Token
{
  TokenKind kind = TokenKind::UnknownToken;
  uint32_t full_start = 0;
  uint32_t start = 0;
  uint32_t length = 0;

  /// Offset one past the last byte
  [[nodiscard]] constexpr uint32_t end() const noexcept { return full_start + length; }

  /// Length of the significant text
  [[nodiscard]] constexpr uint32_t width() const noexcept
  {
    return length - (start - full_start);
  }

  /// Length including leading trivia
  [[nodiscard]] constexpr uint32_t full_width() const noexcept { return length; }

  [[nodiscard]] constexpr uint32_t trivia_width() const noexcept { return start - full_start; }

  [[nodiscard]] std::string_view leading_trivia(std::string_view document) const
  {
    return document.substr(full_start, trivia_width());
  }

  [[nodiscard]] std::string_view text(std::string_view document) const
  {
    return document.substr(start, width());
  }

  [[nodiscard]] std::string_view full_text(std::string_view document) const
  {
    return document.substr(full_start, length);
  }
};

}  // namespace syntree
