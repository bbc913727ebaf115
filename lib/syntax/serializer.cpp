// mathedit/syntax/serializer.cpp - Tree to canonical markup
#include "mathedit/syntax/serializer.hpp"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <vector>

#include "mathedit/tree/visitor.hpp"

namespace mathedit
{
namespace
{

bool is_ascii_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_word_byte(char c) { return is_ascii_letter(c) || static_cast<unsigned char>(c) >= 0x80; }

// True if out[pos] is a backslash that is not itself escaped
bool is_live_backslash(std::string_view out, size_t pos)
{
  size_t count = 0;
  while (pos < out.size() && out[pos] == '\\') {
    ++count;
    if (pos == 0) break;
    --pos;
  }
  return count % 2 == 1;
}

// "...\alpha": a following letter would extend the command name
bool ends_with_command_word(std::string_view out)
{
  size_t i = out.size();
  while (i > 0 && is_ascii_letter(out[i - 1])) {
    --i;
  }
  if (i == out.size() || i == 0) return false;
  return out[i - 1] == '\\' && is_live_backslash(out, i - 1);
}

// "...\ ": the scanner skips the space and would read a following letter as a command
bool ends_with_control_space(std::string_view out)
{
  const size_t n = out.size();
  return n >= 2 && out[n - 1] == ' ' && out[n - 2] == '\\' && is_live_backslash(out, n - 2);
}

bool needs_brace(std::string_view out, char first)
{
  if (out.empty()) return false;
  const char last = out.back();
  if (is_word_byte(last) && is_word_byte(first)) return true;
  if (is_digit(last) && is_digit(first)) return true;
  // "3." followed by "5" would scan as the number 3.5
  if (last == '.' && out.size() >= 2 && is_digit(out[out.size() - 2]) && is_digit(first)) {
    return true;
  }
  return ends_with_control_space(out) && is_ascii_letter(first);
}

void append_item(std::string & out, const std::string & s)
{
  if (s.empty()) return;
  const char first = s.front();
  if (ends_with_command_word(out) && is_ascii_letter(first)) {
    out += ' ';
    out += s;
  } else if (needs_brace(out, first)) {
    out += '{';
    out += s;
    out += '}';
  } else {
    out += s;
  }
}

// An operator that would end the enclosing cell or root index if emitted bare
bool contains_bare(const Expr * node, std::initializer_list<std::string_view> symbols)
{
  if (const auto * op = dyn_cast<OperatorExpr>(node)) {
    return std::find(symbols.begin(), symbols.end(), op->symbol) != symbols.end();
  }
  if (isa<SequenceExpr>(node)) {
    const ExprList items = node->children();
    return std::any_of(items.begin(), items.end(), [&](const Expr * item) {
      if (const auto * op = dyn_cast<OperatorExpr>(item)) {
        return std::find(symbols.begin(), symbols.end(), op->symbol) != symbols.end();
      }
      if (isa_any<PowerExpr, SubscriptExpr>(item)) {
        return contains_bare(item->child(0), symbols);
      }
      return false;
    });
  }
  if (isa_any<PowerExpr, SubscriptExpr>(node)) {
    return contains_bare(node->child(0), symbols);
  }
  return false;
}

class Serializer : public ExprVisitor<Serializer>
{
public:
  explicit Serializer(std::string & out) : out_(out) {}

  /// Top-level or braced content: a Sequence contributes its items unbraced
  void emit_body(const Expr * node)
  {
    if (isa<SequenceExpr>(node)) {
      emit_items(node->children());
    } else {
      visit(node);
    }
  }

  void visit_literal(const LiteralExpr * node) { out_ += node->text; }
  void visit_variable(const VariableExpr * node) { out_ += node->name; }
  void visit_operator(const OperatorExpr * node) { out_ += node->symbol; }

  void visit_text_run(const TextRunExpr * node)
  {
    out_ += '\\';
    out_ += node->command;
    out_ += '{';
    out_ += node->text;
    out_ += '}';
  }

  void visit_placeholder(const PlaceholderExpr * /*node*/) { out_ += "{}"; }

  void visit_fraction(const FractionExpr * node)
  {
    out_ += '\\';
    out_ += node->command;
    emit_argument(node->numerator());
    emit_argument(node->denominator());
  }

  void visit_root(const RootExpr * node)
  {
    out_ += "\\sqrt";
    if (node->has_index()) {
      out_ += '[';
      emit_guarded_body(node->index(), {"]"});
      out_ += ']';
    }
    emit_argument(node->radicand());
  }

  void visit_power(const PowerExpr * node)
  {
    emit_script_base(node->base(), ExprKind::Power);
    out_ += '^';
    emit_argument(node->exponent());
  }

  void visit_subscript(const SubscriptExpr * node)
  {
    emit_script_base(node->base(), ExprKind::Subscript);
    out_ += '_';
    emit_argument(node->subscript());
  }

  void visit_function(const FunctionExpr * node)
  {
    out_ += '\\';
    out_ += node->name;
    for (const Expr * arg : node->children()) {
      emit_argument(arg);
    }
  }

  void visit_matrix(const MatrixExpr * node)
  {
    out_ += "\\begin{";
    out_ += node->environment;
    out_ += '}';
    if (node->column_spec) {
      out_ += '{';
      out_ += *node->column_spec;
      out_ += '}';
    }
    for (uint32_t r = 0; r < node->rows; ++r) {
      if (r > 0) out_ += " \\\\ ";
      for (uint32_t c = 0; c < node->cols; ++c) {
        if (c > 0) out_ += " & ";
        emit_guarded_body(node->cell(r, c), {"&", "\\\\"});
      }
    }
    out_ += "\\end{";
    out_ += node->environment;
    out_ += '}';
  }

  void visit_format_wrapper(const FormatWrapperExpr * node)
  {
    out_ += '\\';
    out_ += node->command;
    if (node->attribute) {
      out_ += '{';
      out_ += *node->attribute;
      out_ += '}';
    }
    emit_argument(node->body());
  }

  void visit_sequence(const SequenceExpr * node)
  {
    // Nested sequences keep their grouping
    out_ += '{';
    emit_items(node->children());
    out_ += '}';
  }

  void visit_big_op(const BigOpExpr * node)
  {
    out_ += '\\';
    out_ += node->command;
    if (node->has_lower) {
      out_ += '_';
      emit_argument(node->lower());
    }
    if (node->has_upper) {
      out_ += '^';
      emit_argument(node->upper());
    }
    emit_argument(node->operand());
  }

private:
  void emit_argument(const Expr * node)
  {
    out_ += '{';
    if (node != nullptr && !isa<PlaceholderExpr>(node)) {
      emit_body(node);
    }
    out_ += '}';
  }

  void emit_guarded_body(const Expr * node, std::initializer_list<std::string_view> symbols)
  {
    if (contains_bare(node, symbols)) {
      out_ += '{';
      emit_body(node);
      out_ += '}';
    } else {
      emit_body(node);
    }
  }

  void emit_script_base(const Expr * base, ExprKind script_kind)
  {
    const bool brace =
      isa<BigOpExpr>(base) || base->get_kind() == script_kind;
    if (brace) {
      out_ += '{';
      visit(base);
      out_ += '}';
    } else {
      // Sequence and Placeholder bases bring their own braces
      visit(base);
    }
  }

  void emit_items(ExprList items)
  {
    std::vector<std::string> parts;
    parts.reserve(items.size());
    for (const Expr * item : items) {
      std::string s;
      Serializer(s).visit(item);
      parts.push_back(std::move(s));
    }

    for (size_t i = 0; i < parts.size(); ++i) {
      // \sin followed by a group would take the group as its argument
      if (
        isa<FunctionExpr>(items[i]) && i + 1 < parts.size() && !parts[i + 1].empty() &&
        parts[i + 1].front() == '{') {
        parts[i] = "{" + parts[i] + "}";
      }
      append_item(out_, parts[i]);
    }
  }

  std::string & out_;
};

}  // namespace

std::string serialize(const Expr * root)
{
  std::string out;
  if (root == nullptr) {
    return out;
  }
  Serializer(out).emit_body(root);
  return out;
}

}  // namespace mathedit
