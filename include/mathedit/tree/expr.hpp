// mathedit/tree/expr.hpp - Expression tree node classes
//
// Nodes are immutable once built and owned by an ExprContext arena. An edit
// produces a new root that shares every untouched subtree with the old one,
// so a node never holds a pointer to its parent.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <utility>

#include "mathedit/basic/casting.hpp"
#include "mathedit/basic/source_manager.hpp"
#include "mathedit/tree/node_kind.hpp"

namespace mathedit
{

class Expr;

/// Arena-backed child list
using ExprList = gsl::span<const Expr * const>;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all expression nodes.
 *
 * Every node has:
 * - An ExprKind for RTTI (using the classof pattern)
 * - A SourceRange into the markup it was built from (invalid for nodes
 *   created by structural edits)
 * - Its ordered children
 */
class Expr
{
public:
  const ExprKind kind;
  SourceRange range_;

  Expr(const Expr &) = delete;
  Expr & operator=(const Expr &) = delete;
  Expr(Expr &&) = delete;
  Expr & operator=(Expr &&) = delete;

  [[nodiscard]] ExprKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

  [[nodiscard]] ExprList children() const noexcept { return children_; }
  [[nodiscard]] size_t child_count() const noexcept { return children_.size(); }
  [[nodiscard]] const Expr * child(size_t i) const noexcept
  {
    return i < children_.size() ? children_[i] : nullptr;
  }

protected:
  Expr(ExprKind k, SourceRange r, ExprList children) : kind(k), range_(r), children_(children) {}
  ~Expr() = default;

private:
  ExprList children_;
};

/**
 * CRTP base that implements classof() for a concrete kind.
 */
template <typename Derived, typename Base, ExprKind K>
class ExprBase : public Base
{
public:
  static constexpr ExprKind kind_value = K;

  static bool classof(const Expr * node) { return node->get_kind() == K; }

protected:
  template <typename... Args>
  explicit ExprBase(SourceRange r, ExprList children, Args &&... args)
  : Base(K, r, children, std::forward<Args>(args)...)
  {
  }
};

// ============================================================================
// Leaves
// ============================================================================

/// Run of digits or letters ("12", "3.5", "x", "ab").
class LiteralExpr : public ExprBase<LiteralExpr, Expr, ExprKind::Literal>
{
public:
  std::string_view text;

  explicit LiteralExpr(std::string_view t, SourceRange r = {}) : ExprBase(r, {}), text(t) {}
};

/// Named symbol such as a Greek letter; payload keeps the backslash ("\alpha").
class VariableExpr : public ExprBase<VariableExpr, Expr, ExprKind::Variable>
{
public:
  std::string_view name;

  explicit VariableExpr(std::string_view n, SourceRange r = {}) : ExprBase(r, {}), name(n) {}
};

/// Operator or punctuation: "+", "(", "\cdot", "\left(", "\,".
class OperatorExpr : public ExprBase<OperatorExpr, Expr, ExprKind::Operator>
{
public:
  std::string_view symbol;

  explicit OperatorExpr(std::string_view s, SourceRange r = {}) : ExprBase(r, {}), symbol(s) {}
};

/// Verbatim text argument of \text and friends.
class TextRunExpr : public ExprBase<TextRunExpr, Expr, ExprKind::TextRun>
{
public:
  std::string_view command;  ///< "text", "mbox", ...
  std::string_view text;

  TextRunExpr(std::string_view cmd, std::string_view t, SourceRange r = {})
  : ExprBase(r, {}), command(cmd), text(t)
  {
  }
};

/// Empty, fillable slot. Serializes as "{}".
class PlaceholderExpr : public ExprBase<PlaceholderExpr, Expr, ExprKind::Placeholder>
{
public:
  explicit PlaceholderExpr(SourceRange r = {}) : ExprBase(r, {}) {}
};

// ============================================================================
// Structures
// ============================================================================

/// children = [numerator, denominator]
class FractionExpr : public ExprBase<FractionExpr, Expr, ExprKind::Fraction>
{
public:
  std::string_view command;  ///< "frac", "dfrac", "binom", ...

  FractionExpr(std::string_view cmd, ExprList children, SourceRange r = {})
  : ExprBase(r, children), command(cmd)
  {
  }

  [[nodiscard]] const Expr * numerator() const noexcept { return child(0); }
  [[nodiscard]] const Expr * denominator() const noexcept { return child(1); }
};

/// children = [radicand] or [radicand, index]
class RootExpr : public ExprBase<RootExpr, Expr, ExprKind::Root>
{
public:
  explicit RootExpr(ExprList children, SourceRange r = {}) : ExprBase(r, children) {}

  [[nodiscard]] const Expr * radicand() const noexcept { return child(0); }
  [[nodiscard]] const Expr * index() const noexcept { return child(1); }
  [[nodiscard]] bool has_index() const noexcept { return child_count() > 1; }
};

/// children = [base, exponent]
class PowerExpr : public ExprBase<PowerExpr, Expr, ExprKind::Power>
{
public:
  explicit PowerExpr(ExprList children, SourceRange r = {}) : ExprBase(r, children) {}

  [[nodiscard]] const Expr * base() const noexcept { return child(0); }
  [[nodiscard]] const Expr * exponent() const noexcept { return child(1); }
};

/// children = [base, subscript]
class SubscriptExpr : public ExprBase<SubscriptExpr, Expr, ExprKind::Subscript>
{
public:
  explicit SubscriptExpr(ExprList children, SourceRange r = {}) : ExprBase(r, children) {}

  [[nodiscard]] const Expr * base() const noexcept { return child(0); }
  [[nodiscard]] const Expr * subscript() const noexcept { return child(1); }
};

/// Named function or unknown command; children are its brace-group arguments.
class FunctionExpr : public ExprBase<FunctionExpr, Expr, ExprKind::Function>
{
public:
  std::string_view name;  ///< without backslash

  FunctionExpr(std::string_view n, ExprList args, SourceRange r = {})
  : ExprBase(r, args), name(n)
  {
  }
};

/// Rectangular grid from \begin{env} ... \end{env}; children are cells, row-major.
class MatrixExpr : public ExprBase<MatrixExpr, Expr, ExprKind::Matrix>
{
public:
  std::string_view environment;
  std::optional<std::string_view> column_spec;  ///< array only
  uint32_t rows;
  uint32_t cols;

  MatrixExpr(
    std::string_view env, std::optional<std::string_view> spec, uint32_t row_count,
    uint32_t col_count, ExprList cells, SourceRange r = {})
  : ExprBase(r, cells), environment(env), column_spec(spec), rows(row_count), cols(col_count)
  {
  }

  [[nodiscard]] const Expr * cell(uint32_t row, uint32_t col) const noexcept
  {
    if (row >= rows || col >= cols) return nullptr;
    return child(static_cast<size_t>(row) * cols + col);
  }
};

/// \cmd{body} or \cmd{attribute}{body}; children = [body]
class FormatWrapperExpr : public ExprBase<FormatWrapperExpr, Expr, ExprKind::FormatWrapper>
{
public:
  std::string_view command;
  std::optional<std::string_view> attribute;  ///< e.g. the color of \textcolor

  FormatWrapperExpr(
    std::string_view cmd, std::optional<std::string_view> attr, ExprList body,
    SourceRange r = {})
  : ExprBase(r, body), command(cmd), attribute(attr)
  {
  }

  [[nodiscard]] const Expr * body() const noexcept { return child(0); }
};

/// Siblings in reading order.
class SequenceExpr : public ExprBase<SequenceExpr, Expr, ExprKind::Sequence>
{
public:
  explicit SequenceExpr(ExprList items, SourceRange r = {}) : ExprBase(r, items) {}
};

// ============================================================================
// Big operators
// ============================================================================

/**
 * Integral, sum, product and limit: children are [lower?][upper?] operand.
 */
class BigOpExpr : public Expr
{
public:
  std::string_view command;  ///< "int", "oint", "sum", "lim", ...
  bool has_lower;
  bool has_upper;

  static bool classof(const Expr * node) { return is_big_op_kind(node->get_kind()); }

  [[nodiscard]] const Expr * lower() const noexcept { return has_lower ? child(0) : nullptr; }
  [[nodiscard]] const Expr * upper() const noexcept
  {
    return has_upper ? child(has_lower ? 1 : 0) : nullptr;
  }
  [[nodiscard]] const Expr * operand() const noexcept
  {
    return child_count() == 0 ? nullptr : child(child_count() - 1);
  }

protected:
  BigOpExpr(
    ExprKind k, SourceRange r, ExprList children, std::string_view cmd, bool lower, bool upper)
  : Expr(k, r, children), command(cmd), has_lower(lower), has_upper(upper)
  {
  }
};

#define EXPR_NODE_BIG_OP(Class, Kind, Snake)                                                \
  class Class : public ExprBase<Class, BigOpExpr, ExprKind::Kind>                          \
  {                                                                                         \
  public:                                                                                   \
    Class(                                                                                  \
      std::string_view cmd, bool lower, bool upper, ExprList children, SourceRange r = {}) \
    : ExprBase(r, children, cmd, lower, upper)                                              \
    {                                                                                       \
    }                                                                                       \
  };
#include "mathedit/tree/expr_nodes.def"

}  // namespace mathedit
