// mathedit/syntax/token.hpp - Markup tokens
#pragma once

#include <cstdint>
#include <string_view>

#include "mathedit/basic/source_manager.hpp"

namespace mathedit::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Command,        // \frac  (text = "frac")
  ControlSymbol,  // \, \{ \%  (text = the single character, may be empty at end of input)

  OpenGroup,     // {
  CloseGroup,    // }
  OpenBracket,   // [
  CloseBracket,  // ]

  SubscriptMarker,    // _
  SuperscriptMarker,  // ^

  Literal,  // digit run, letter run, or one other character

  EnvironmentBegin,  // \begin{name}  (text = "name")
  EnvironmentEnd,    // \end{name}    (text = "name")

  RowSeparator,     // \\ (backslash pair)
  ColumnSeparator,  // &

  Comment,  // % ... end of line (text excludes the '%')
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the markup, including backslashes and braces
  std::string_view text;  // slice view; meaning depends on kind

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Command:
      return "command";
    case TokenKind::ControlSymbol:
      return "control symbol";
    case TokenKind::OpenGroup:
      return "{";
    case TokenKind::CloseGroup:
      return "}";
    case TokenKind::OpenBracket:
      return "[";
    case TokenKind::CloseBracket:
      return "]";
    case TokenKind::SubscriptMarker:
      return "_";
    case TokenKind::SuperscriptMarker:
      return "^";
    case TokenKind::Literal:
      return "literal";
    case TokenKind::EnvironmentBegin:
      return "\\begin";
    case TokenKind::EnvironmentEnd:
      return "\\end";
    case TokenKind::RowSeparator:
      return "\\\\";
    case TokenKind::ColumnSeparator:
      return "&";
    case TokenKind::Comment:
      return "<comment>";
  }
  return "<unknown>";
}

}  // namespace mathedit::syntax
