// mathedit/syntax/parser.cpp - Recursive-descent tree builder
#include "mathedit/syntax/parser.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "mathedit/syntax/commands.hpp"

namespace mathedit::syntax
{
namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

bool is_ascii_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_word_byte(char c) { return is_ascii_letter(c) || static_cast<unsigned char>(c) >= 0x80; }

size_t utf8_length(char lead)
{
  const auto b = static_cast<unsigned char>(lead);
  if (b >= 0xF0) return 4;
  if (b >= 0xE0) return 3;
  if (b >= 0xC0) return 2;
  return 1;
}

// Comments dropped, line breaks and tabs folded to spaces; escapes kept intact
std::string canonical_text(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '\\' && i + 1 < raw.size()) {
      out.push_back(c);
      out.push_back(is_space(raw[i + 1]) ? ' ' : raw[i + 1]);
      ++i;
      continue;
    }
    if (c == '%') {
      while (i < raw.size() && raw[i] != '\n') {
        ++i;
      }
      if (i < raw.size()) {
        out.push_back(' ');
      }
      continue;
    }
    out.push_back(is_space(c) ? ' ' : c);
  }
  return out;
}

std::string control_symbol_payload(std::string_view text)
{
  if (!text.empty() && is_space(text.front())) {
    return "\\ ";
  }
  return "\\" + std::string(text);
}

struct NestingGuard
{
  uint32_t & depth;
  explicit NestingGuard(uint32_t & d) : depth(d) { ++depth; }
  ~NestingGuard() { --depth; }
  NestingGuard(const NestingGuard &) = delete;
  NestingGuard & operator=(const NestingGuard &) = delete;
};

}  // namespace

Parser::Parser(
  ExprContext & ctx, std::string_view source, DiagnosticBag & diags, std::vector<Token> tokens)
: ctx_(ctx), source_(source), diags_(diags), tokens_(std::move(tokens))
{
  tokens_.erase(
    std::remove_if(
      tokens_.begin(), tokens_.end(), [](const Token & t) { return t.kind == TokenKind::Comment; }),
    tokens_.end());
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    const auto end = static_cast<uint32_t>(source_.size());
    tokens_.push_back(Token{TokenKind::Eof, SourceRange(end, end), {}});
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_atom_start() const
{
  switch (cur().kind) {
    case TokenKind::Literal:
    case TokenKind::Command:
    case TokenKind::OpenGroup:
    case TokenKind::OpenBracket:
    case TokenKind::EnvironmentBegin:
      return true;
    case TokenKind::ControlSymbol:
      return !cur().text.empty();
    default:
      return false;
  }
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
    last_end_ = t.end();
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

// ============================================================================
// Entry
// ============================================================================

const Expr * Parser::parse_formula()
{
  // At the top level only Eof ends the list; stray closers are reported and skipped
  const auto items = parse_items(StopSet::None);
  return collapse(items, SourceRange(0, static_cast<uint32_t>(source_.size())));
}

// ============================================================================
// Lists and atoms
// ============================================================================

std::vector<const Expr *> Parser::parse_items(StopSet stop)
{
  std::vector<const Expr *> items;
  while (true) {
    const Token & t = cur();
    switch (t.kind) {
      case TokenKind::Eof:
        return items;
      case TokenKind::CloseGroup:
        if (group_depth_ > 0) {
          return items;
        }
        diags_.report(ErrorKind::UnbalancedGroup, t.range, "unmatched '}'", "no open group to close");
        advance();
        continue;
      case TokenKind::EnvironmentEnd:
        if (env_depth_ > 0) {
          return items;
        }
        diags_.report(
          ErrorKind::UnbalancedGroup, t.range,
          "unmatched '\\end{" + std::string(t.text) + "}'", "no open environment to close");
        advance();
        continue;
      case TokenKind::CloseBracket:
        if (stop & StopSet::Bracket) {
          return items;
        }
        break;
      case TokenKind::ColumnSeparator:
      case TokenKind::RowSeparator:
        if (stop & StopSet::Cell) {
          return items;
        }
        break;
      default:
        break;
    }

    if (const Expr * e = parse_scripted()) {
      items.push_back(e);
    }
  }
}

const Expr * Parser::parse_scripted()
{
  const uint32_t start = cur().begin();

  const Expr * base = nullptr;
  if (at(TokenKind::SubscriptMarker) || at(TokenKind::SuperscriptMarker)) {
    base = make_placeholder_at(cur());
  } else {
    base = parse_atom();
    if (base == nullptr) {
      return nullptr;
    }
  }

  // x_a^b nests left to right: Power(Subscript(x, a), b)
  while (at(TokenKind::SubscriptMarker) || at(TokenKind::SuperscriptMarker)) {
    const Token marker = advance();
    const Expr * arg = parse_argument(marker);
    const ExprList kids = ctx_.list({base, arg});
    if (marker.kind == TokenKind::SuperscriptMarker) {
      base = ctx_.create<PowerExpr>(kids, range_from(start));
    } else {
      base = ctx_.create<SubscriptExpr>(kids, range_from(start));
    }
  }
  return base;
}

const Expr * Parser::parse_atom()
{
  const NestingGuard guard(nesting_);
  if (nesting_ > k_max_parse_nesting) {
    return skip_too_deep();
  }

  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Literal:
      return parse_literal(false);
    case TokenKind::Command:
      return parse_command();
    case TokenKind::ControlSymbol: {
      advance();
      if (t.text.empty()) {
        // Lone backslash at end of input
        return nullptr;
      }
      return ctx_.create<OperatorExpr>(ctx_.intern(control_symbol_payload(t.text)), t.range);
    }
    case TokenKind::OpenGroup:
      return parse_group();
    case TokenKind::EnvironmentBegin:
      return parse_environment();
    case TokenKind::OpenBracket:
    case TokenKind::CloseBracket:
    case TokenKind::ColumnSeparator:
    case TokenKind::RowSeparator: {
      // Outside the context that gives them meaning these are plain symbols
      advance();
      return ctx_.create<OperatorExpr>(ctx_.intern(t.text), t.range);
    }
    default:
      return nullptr;
  }
}

const Expr * Parser::parse_group()
{
  // Script arguments reach here without passing through parse_atom
  const NestingGuard guard(nesting_);
  if (nesting_ > k_max_parse_nesting) {
    return skip_too_deep();
  }

  const Token open = advance();

  ++group_depth_;
  const auto items = parse_items(StopSet::Group);
  --group_depth_;

  if (!match(TokenKind::CloseGroup)) {
    const uint32_t at_pos = cur().begin();
    diags_.report(ErrorKind::UnbalancedGroup, open.range, "unclosed group", "this '{' is never closed")
      .with_fixit(SourceRange(at_pos, at_pos), "}");
  }
  return collapse(items, range_from(open.begin()));
}

const Expr * Parser::parse_argument(const Token & owner)
{
  switch (cur().kind) {
    case TokenKind::OpenGroup:
      return parse_group();
    case TokenKind::Literal:
      // \frac12 takes one character per argument
      return parse_literal(true);
    case TokenKind::Command:
    case TokenKind::EnvironmentBegin:
      return parse_atom();
    case TokenKind::ControlSymbol:
      if (!cur().text.empty()) {
        return parse_atom();
      }
      break;
    default:
      break;
  }

  report_missing_argument(owner);
  return make_placeholder_at(cur());
}

const Expr * Parser::parse_literal(bool first_char_only)
{
  Token & t = tokens_[idx_];
  const std::string_view text = t.text;
  const char c = text.front();

  size_t len = 0;
  if (first_char_only) {
    len = utf8_length(c);
  } else if (is_digit(c)) {
    while (len < text.size() && is_digit(text[len])) {
      ++len;
    }
    if (len + 1 < text.size() && text[len] == '.' && is_digit(text[len + 1])) {
      ++len;
      while (len < text.size() && is_digit(text[len])) {
        ++len;
      }
    }
  } else if (is_word_byte(c)) {
    while (len < text.size() && is_word_byte(text[len])) {
      ++len;
    }
  } else {
    len = 1;
  }
  len = std::min(len, text.size());

  const std::string_view piece = text.substr(0, len);
  const SourceRange r(t.begin(), t.begin() + static_cast<uint32_t>(len));

  if (len >= text.size()) {
    advance();
  } else {
    // Leave the rest of the run for the next argument or item
    t.text.remove_prefix(len);
    t.range = SourceRange(r.get_end(), t.range.get_end());
    last_end_ = r.get_end().get_offset();
  }

  if (is_digit(c) || is_word_byte(c)) {
    return ctx_.create<LiteralExpr>(ctx_.intern(piece), r);
  }
  return ctx_.create<OperatorExpr>(ctx_.intern(piece), r);
}

// ============================================================================
// Commands
// ============================================================================

const Expr * Parser::parse_command()
{
  const Token cmd = advance();

  switch (classify_command(cmd.text)) {
    case CommandClass::Fraction:
      return parse_fraction(cmd);
    case CommandClass::Root:
      return parse_root(cmd);
    case CommandClass::BigOperator:
      return parse_big_operator(cmd);
    case CommandClass::Text:
      return parse_text(cmd);
    case CommandClass::Format:
      return parse_format(cmd, false);
    case CommandClass::ColoredFormat:
      return parse_format(cmd, true);
    case CommandClass::Symbol:
      return ctx_.create<VariableExpr>(ctx_.intern("\\" + std::string(cmd.text)), cmd.range);
    case CommandClass::Operator:
      return ctx_.create<OperatorExpr>(ctx_.intern("\\" + std::string(cmd.text)), cmd.range);
    case CommandClass::Delimiter:
      return parse_delimiter(cmd);
    case CommandClass::Function:
      return parse_function(cmd);
  }
  return parse_function(cmd);
}

const Expr * Parser::parse_fraction(const Token & cmd)
{
  const Expr * num = parse_argument(cmd);
  const Expr * den = parse_argument(cmd);
  return ctx_.create<FractionExpr>(
    ctx_.intern(cmd.text), ctx_.list({num, den}), range_from(cmd.begin()));
}

const Expr * Parser::parse_root(const Token & cmd)
{
  const Expr * index = nullptr;
  if (at(TokenKind::OpenBracket)) {
    const Token open = advance();
    const auto items = parse_items(StopSet::Bracket);
    if (!match(TokenKind::CloseBracket)) {
      const uint32_t at_pos = cur().begin();
      diags_
        .report(ErrorKind::UnbalancedGroup, open.range, "unclosed root index", "this '[' is never closed")
        .with_fixit(SourceRange(at_pos, at_pos), "]");
    }
    index = collapse(items, range_from(open.begin()));
  }

  const Expr * radicand = parse_argument(cmd);
  const ExprList kids = index != nullptr ? ctx_.list({radicand, index}) : ctx_.list({radicand});
  return ctx_.create<RootExpr>(kids, range_from(cmd.begin()));
}

const Expr * Parser::parse_big_operator(const Token & cmd)
{
  const Expr * lower = nullptr;
  const Expr * upper = nullptr;

  // Limits in either order, each at most once
  for (int i = 0; i < 2; ++i) {
    if (at(TokenKind::SubscriptMarker) && lower == nullptr) {
      const Token marker = advance();
      lower = parse_argument(marker);
    } else if (at(TokenKind::SuperscriptMarker) && upper == nullptr) {
      const Token marker = advance();
      upper = parse_argument(marker);
    } else {
      break;
    }
  }

  const Expr * operand = at_atom_start() ? parse_scripted() : nullptr;
  if (operand == nullptr) {
    report_missing_argument(cmd);
    operand = make_placeholder_at(cur());
  }

  std::vector<const Expr *> kids;
  if (lower != nullptr) kids.push_back(lower);
  if (upper != nullptr) kids.push_back(upper);
  kids.push_back(operand);

  const std::string_view name = ctx_.intern(cmd.text);
  const bool has_lower = lower != nullptr;
  const bool has_upper = upper != nullptr;
  const ExprList list = ctx_.list(kids);
  const SourceRange r = range_from(cmd.begin());

  switch (big_operator_kind(cmd.text)) {
    case ExprKind::Sum:
      return ctx_.create<SumExpr>(name, has_lower, has_upper, list, r);
    case ExprKind::Product:
      return ctx_.create<ProductExpr>(name, has_lower, has_upper, list, r);
    case ExprKind::Limit:
      return ctx_.create<LimitExpr>(name, has_lower, has_upper, list, r);
    default:
      return ctx_.create<IntegralExpr>(name, has_lower, has_upper, list, r);
  }
}

const Expr * Parser::parse_text(const Token & cmd)
{
  std::string body;
  if (at(TokenKind::OpenGroup)) {
    body = parse_raw_group();
  } else {
    report_missing_argument(cmd);
  }
  return ctx_.create<TextRunExpr>(
    ctx_.intern(cmd.text), ctx_.intern(body), range_from(cmd.begin()));
}

const Expr * Parser::parse_format(const Token & cmd, bool colored)
{
  std::optional<std::string_view> attribute;
  if (colored) {
    if (at(TokenKind::OpenGroup)) {
      attribute = ctx_.intern(parse_raw_group());
    } else {
      report_missing_argument(cmd);
      attribute = ctx_.intern("");
    }
  }

  const Expr * body = parse_argument(cmd);
  return ctx_.create<FormatWrapperExpr>(
    ctx_.intern(cmd.text), attribute, ctx_.list({body}), range_from(cmd.begin()));
}

const Expr * Parser::parse_delimiter(const Token & cmd)
{
  std::string delim;
  switch (cur().kind) {
    case TokenKind::Literal: {
      // Only the first character belongs to the delimiter: \left(x
      Token & t = tokens_[idx_];
      const size_t len = std::min(utf8_length(t.text.front()), t.text.size());
      delim = std::string(t.text.substr(0, len));
      if (len >= t.text.size()) {
        advance();
      } else {
        const uint32_t split = t.begin() + static_cast<uint32_t>(len);
        t.text.remove_prefix(len);
        t.range = SourceRange(split, t.end());
        last_end_ = split;
      }
      break;
    }
    case TokenKind::ControlSymbol:
      if (!cur().text.empty()) {
        delim = control_symbol_payload(advance().text);
      }
      break;
    case TokenKind::Command:
      delim = "\\" + std::string(advance().text);
      break;
    case TokenKind::OpenBracket:
    case TokenKind::CloseBracket:
      delim = std::string(advance().text);
      break;
    default:
      break;
  }

  if (delim.empty()) {
    report_missing_argument(cmd);
  }

  std::string payload = "\\" + std::string(cmd.text);
  if (!delim.empty() && is_ascii_letter(delim.front())) {
    payload += ' ';
  }
  payload += delim;
  return ctx_.create<OperatorExpr>(ctx_.intern(payload), range_from(cmd.begin()));
}

const Expr * Parser::parse_function(const Token & cmd)
{
  // Every brace group that follows directly is an argument
  std::vector<const Expr *> args;
  while (at(TokenKind::OpenGroup)) {
    args.push_back(parse_group());
  }
  return ctx_.create<FunctionExpr>(ctx_.intern(cmd.text), ctx_.list(args), range_from(cmd.begin()));
}

// ============================================================================
// Environments
// ============================================================================

const Expr * Parser::parse_environment()
{
  const Token begin = advance();
  const std::string_view name = ctx_.intern(begin.text);

  ++env_depth_;

  std::optional<std::string_view> column_spec;
  if (name == "array") {
    if (at(TokenKind::OpenGroup)) {
      column_spec = ctx_.intern(parse_raw_group());
    } else {
      report_missing_argument(begin);
    }
  }

  std::vector<std::vector<const Expr *>> rows(1);
  while (true) {
    const uint32_t cell_begin = cur().begin();
    const auto items = parse_items(StopSet::Cell);
    rows.back().push_back(collapse(items, range_from(cell_begin)));

    if (match(TokenKind::ColumnSeparator)) {
      continue;
    }
    if (match(TokenKind::RowSeparator)) {
      // A trailing row break before \end does not open a new row
      if (at(TokenKind::EnvironmentEnd)) {
        break;
      }
      rows.emplace_back();
      continue;
    }
    break;
  }

  --env_depth_;

  if (at(TokenKind::EnvironmentEnd)) {
    const Token end = advance();
    if (end.text != name) {
      diags_
        .report(
          ErrorKind::UnbalancedGroup, end.range, "mismatched environment end",
          "expected '\\end{" + std::string(name) + "}'")
        .with_secondary_label(begin.range, "environment opened here");
    }
  } else {
    const uint32_t at_pos = cur().begin();
    diags_
      .report(
        ErrorKind::UnbalancedGroup, begin.range,
        "unclosed environment '" + std::string(name) + "'", "this environment is never closed")
      .with_fixit(SourceRange(at_pos, at_pos), "\\end{" + std::string(name) + "}");
  }

  size_t cols = 0;
  for (const auto & row : rows) {
    cols = std::max(cols, row.size());
  }

  const bool ragged = std::any_of(
    rows.begin(), rows.end(), [cols](const auto & row) { return row.size() != cols; });
  if (ragged) {
    diags_.report(
      ErrorKind::ArityMismatch, begin.range,
      "rows of '" + std::string(name) + "' have different numbers of cells",
      "short rows are padded with empty cells");
  }

  std::vector<const Expr *> cells;
  cells.reserve(rows.size() * cols);
  const SourceRange pad_range(last_end_, last_end_);
  for (const auto & row : rows) {
    cells.insert(cells.end(), row.begin(), row.end());
    for (size_t c = row.size(); c < cols; ++c) {
      cells.push_back(ctx_.create<PlaceholderExpr>(pad_range));
    }
  }

  return ctx_.create<MatrixExpr>(
    name, column_spec, static_cast<uint32_t>(rows.size()), static_cast<uint32_t>(cols),
    ctx_.list(cells), range_from(begin.begin()));
}

std::string Parser::parse_raw_group()
{
  const Token open = advance();

  uint32_t depth = 1;
  while (!at_eof()) {
    const Token & t = cur();
    if (t.kind == TokenKind::OpenGroup) {
      ++depth;
    } else if (t.kind == TokenKind::CloseGroup && --depth == 0) {
      const std::string_view raw = source_.substr(open.end(), t.begin() - open.end());
      advance();
      return canonical_text(raw);
    }
    advance();
  }

  const uint32_t at_pos = cur().begin();
  diags_.report(ErrorKind::UnbalancedGroup, open.range, "unclosed group", "this '{' is never closed")
    .with_fixit(SourceRange(at_pos, at_pos), "}");
  return canonical_text(source_.substr(std::min<size_t>(open.end(), source_.size())));
}

// ============================================================================
// Recovery
// ============================================================================

void Parser::skip_balanced()
{
  if (!at(TokenKind::OpenGroup) && !at(TokenKind::EnvironmentBegin)) {
    advance();
    return;
  }

  const TokenKind open = cur().kind;
  const TokenKind close =
    open == TokenKind::OpenGroup ? TokenKind::CloseGroup : TokenKind::EnvironmentEnd;
  uint32_t depth = 0;
  while (!at_eof()) {
    const TokenKind k = advance().kind;
    if (k == open) {
      ++depth;
    } else if (k == close && --depth == 0) {
      return;
    }
  }
}

const Expr * Parser::skip_too_deep()
{
  const Token t = cur();
  if (!reported_too_deep_) {
    diags_.report(
      ErrorKind::TooDeep, t.range, "formula is nested too deeply to build",
      "nesting limit reached here");
    reported_too_deep_ = true;
  }
  skip_balanced();
  return ctx_.create<PlaceholderExpr>(range_from(t.begin()));
}

const Expr * Parser::make_placeholder_at(const Token & t)
{
  return ctx_.create<PlaceholderExpr>(SourceRange(t.begin(), t.begin()));
}

void Parser::report_missing_argument(const Token & owner)
{
  std::string what;
  switch (owner.kind) {
    case TokenKind::Command:
      what = "'\\" + std::string(owner.text) + "'";
      break;
    case TokenKind::EnvironmentBegin:
      what = "'\\begin{" + std::string(owner.text) + "}'";
      break;
    default:
      what = "'" + std::string(owner.text) + "'";
      break;
  }
  diags_.report(
    ErrorKind::ArityMismatch, owner.range, "missing argument for " + what,
    "expects an argument here");
}

const Expr * Parser::collapse(const std::vector<const Expr *> & items, SourceRange r)
{
  if (items.empty()) {
    return ctx_.create<PlaceholderExpr>(r);
  }
  if (items.size() == 1) {
    return items.front();
  }
  return ctx_.create<SequenceExpr>(ctx_.list(items), r);
}

}  // namespace mathedit::syntax
