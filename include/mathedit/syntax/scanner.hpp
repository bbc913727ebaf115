// mathedit/syntax/scanner.hpp - Markup token scanner
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "mathedit/syntax/token.hpp"

namespace mathedit::syntax
{

/**
 * Single left-to-right pass over markup; never fails.
 *
 * Whitespace is skipped. Whitespace and % comments between a backslash and
 * the command letters are skipped too, so "\ input" scans as
 * Command("input"). Unterminated groups are the builder's concern.
 */
class Scanner
{
public:
  explicit Scanner(std::string_view src) : src_(src) {}

  /// All tokens, always terminated by one Eof token
  [[nodiscard]] std::vector<Token> scan_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();
  void skip_comment();

  [[nodiscard]] Token scan_comment();
  [[nodiscard]] Token scan_backslash();
  [[nodiscard]] Token scan_literal();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start, std::string_view text) const
  {
    return Token{kind, SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)), text};
  }

  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper around Scanner::scan_all
[[nodiscard]] std::vector<Token> scan(std::string_view markup);

}  // namespace mathedit::syntax
