// mathedit/tree/tree_dumper.hpp - Debug tree output
//
// Dumps expression trees in a human-readable indented format for the CLI
// `dump` command and for tests.
//
#pragma once

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/visitor.hpp"

namespace mathedit
{

/**
 * Dumps an expression tree.
 *
 * @code
 *   Sequence
 *   |-Fraction 'frac'
 *   | |-Literal 'a'
 *   | `-Literal 'b'
 *   |-Operator '+'
 *   `-Power
 *     |-Variable '\alpha'
 *     `-Literal '2'
 * @endcode
 */
class TreeDumper : public ExprVisitor<TreeDumper, void>
{
public:
  explicit TreeDumper(std::ostream & os) : os_(os) {}

  /// Dump a node and its subtree; the root is printed without a branch marker
  void dump(const Expr * node)
  {
    if (node == nullptr) {
      os_ << "<null>\n";
      return;
    }
    at_root_ = true;
    visit(node);
  }

  /// Property for display: either key='value' or a bare value
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}
    Prop(std::string_view k, uint32_t v) : key(k), value(std::to_string(v)) {}

    Prop(std::string_view v) : value(v) {}  // NOLINT(google-explicit-constructor)
    Prop(const char * v) : value(v) {}      // NOLINT(google-explicit-constructor)
  };

  /// Print a node line followed by all its children
  void print_tree(std::string_view label, const std::vector<Prop> & props, ExprList children)
  {
    print_prefix();
    os_ << label;
    for (const auto & prop : props) {
      if (prop.key.empty()) {
        os_ << " " << prop.value;
      } else {
        os_ << " " << prop.key << "='" << prop.value << "'";
      }
    }
    os_ << "\n";

    if (children.empty()) {
      return;
    }
    const IndentScope scope(*this);
    for (size_t i = 0; i < children.size(); ++i) {
      is_last_ = (i == children.size() - 1);
      visit(children[i]);
    }
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_literal(const LiteralExpr * node)
  {
    print_tree("Literal", {Prop(quoted(node->text))}, {});
  }
  void visit_variable(const VariableExpr * node)
  {
    print_tree("Variable", {Prop(quoted(node->name))}, {});
  }
  void visit_operator(const OperatorExpr * node)
  {
    print_tree("Operator", {Prop(quoted(node->symbol))}, {});
  }
  void visit_text_run(const TextRunExpr * node)
  {
    print_tree("TextRun", {Prop("command", node->command), Prop(quoted(node->text))}, {});
  }
  void visit_placeholder(const PlaceholderExpr * /*node*/) { print_tree("Placeholder", {}, {}); }

  void visit_fraction(const FractionExpr * node)
  {
    print_tree("Fraction", {Prop(quoted(node->command))}, node->children());
  }
  void visit_root(const RootExpr * node)
  {
    std::vector<Prop> props;
    if (node->has_index()) props.emplace_back("[indexed]");
    print_tree("Root", props, node->children());
  }
  void visit_power(const PowerExpr * node) { print_tree("Power", {}, node->children()); }
  void visit_subscript(const SubscriptExpr * node)
  {
    print_tree("Subscript", {}, node->children());
  }
  void visit_function(const FunctionExpr * node)
  {
    print_tree("Function", {Prop(quoted(node->name))}, node->children());
  }
  void visit_matrix(const MatrixExpr * node)
  {
    std::vector<Prop> props = {Prop(quoted(node->environment))};
    props.emplace_back(std::to_string(node->rows) + "x" + std::to_string(node->cols));
    if (node->column_spec) props.emplace_back("spec", *node->column_spec);
    print_tree("Matrix", props, node->children());
  }
  void visit_format_wrapper(const FormatWrapperExpr * node)
  {
    std::vector<Prop> props = {Prop(quoted(node->command))};
    if (node->attribute) props.emplace_back("attr", *node->attribute);
    print_tree("FormatWrapper", props, node->children());
  }
  void visit_sequence(const SequenceExpr * node) { print_tree("Sequence", {}, node->children()); }

  void visit_big_op(const BigOpExpr * node)
  {
    std::vector<Prop> props = {Prop(quoted(node->command))};
    if (node->has_lower) props.emplace_back("[lower]");
    if (node->has_upper) props.emplace_back("[upper]");
    print_tree(to_string(node->get_kind()), props, node->children());
  }

private:
  static std::string quoted(std::string_view s) { return "'" + std::string(s) + "'"; }

  void print_prefix()
  {
    if (at_root_) {
      at_root_ = false;
      return;
    }
    os_ << prefix_;
    os_ << (is_last_ ? "`-" : "|-");
  }

  struct IndentScope
  {
    TreeDumper & d;
    std::string saved;
    bool was_root;

    explicit IndentScope(TreeDumper & dumper) : d(dumper), saved(d.prefix_), was_root(d.depth_ == 0)
    {
      // Children of the root start at column 0
      if (!was_root) {
        d.prefix_ += d.is_last_ ? "  " : "| ";
      }
      ++d.depth_;
    }

    ~IndentScope()
    {
      --d.depth_;
      d.prefix_ = saved;
    }
  };

  std::ostream & os_;
  std::string prefix_;
  bool is_last_ = true;
  bool at_root_ = true;
  int depth_ = 0;
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const Expr * node, std::ostream & os)
{
  TreeDumper dumper(os);
  dumper.dump(node);
}

inline std::string dump_to_string(const Expr * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace mathedit
