// mathedit/syntax/parser.hpp - Recursive-descent tree builder
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/basic/source_manager.hpp"
#include "mathedit/syntax/token.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"

namespace mathedit::syntax
{

/// Tokens that end an item list in the current context
enum class StopSet : uint32_t {
  None = 0,
  Group = 1 << 0,    // }
  Bracket = 1 << 1,  // ]
  Cell = 1 << 2,     // & or a backslash pair
};

inline StopSet operator|(StopSet a, StopSet b)
{
  return static_cast<StopSet>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(StopSet a, StopSet b)
{
  return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

/**
 * Builds an expression tree from markup tokens.
 *
 * The parser always returns a tree. Unbalanced groups and missing arguments
 * are reported to the DiagnosticBag and patched with Placeholders so the
 * partial tree stays well-formed. All payload text is interned into the
 * context, so the tree outlives the markup it was built from.
 */
class Parser
{
public:
  /// Hard recursion limit; deeper input is skipped and reported as TooDeep
  static constexpr uint32_t k_max_parse_nesting = 256;

  Parser(
    ExprContext & ctx, std::string_view source, DiagnosticBag & diags, std::vector<Token> tokens);

  [[nodiscard]] const Expr * parse_formula();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_atom_start() const;

  const Token & advance();
  bool match(TokenKind k);

  [[nodiscard]] SourceRange range_from(uint32_t begin) const noexcept
  {
    return {begin, last_end_ < begin ? begin : last_end_};
  }

  // Lists and atoms
  [[nodiscard]] std::vector<const Expr *> parse_items(StopSet stop);
  [[nodiscard]] const Expr * parse_scripted();
  [[nodiscard]] const Expr * parse_atom();
  [[nodiscard]] const Expr * parse_group();
  [[nodiscard]] const Expr * parse_argument(const Token & owner);
  [[nodiscard]] const Expr * parse_literal(bool first_char_only);

  // Commands
  [[nodiscard]] const Expr * parse_command();
  [[nodiscard]] const Expr * parse_fraction(const Token & cmd);
  [[nodiscard]] const Expr * parse_root(const Token & cmd);
  [[nodiscard]] const Expr * parse_big_operator(const Token & cmd);
  [[nodiscard]] const Expr * parse_text(const Token & cmd);
  [[nodiscard]] const Expr * parse_format(const Token & cmd, bool colored);
  [[nodiscard]] const Expr * parse_delimiter(const Token & cmd);
  [[nodiscard]] const Expr * parse_function(const Token & cmd);

  [[nodiscard]] const Expr * parse_environment();

  /// Verbatim content of a balanced brace group, comments stripped
  [[nodiscard]] std::string parse_raw_group();

  // Recovery
  void skip_balanced();
  /// Reports TooDeep once, skips the construct at the cursor and patches it
  [[nodiscard]] const Expr * skip_too_deep();
  [[nodiscard]] const Expr * make_placeholder_at(const Token & t);
  void report_missing_argument(const Token & owner);

  [[nodiscard]] const Expr * collapse(const std::vector<const Expr *> & items, SourceRange r);

  ExprContext & ctx_;
  std::string_view source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  uint32_t last_end_ = 0;

  uint32_t nesting_ = 0;
  uint32_t group_depth_ = 0;
  uint32_t env_depth_ = 0;
  bool reported_too_deep_ = false;
};

}  // namespace mathedit::syntax
