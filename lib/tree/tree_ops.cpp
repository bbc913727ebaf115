// mathedit/tree/tree_ops.cpp - Paths, path copying and structural queries
#include "mathedit/tree/tree_ops.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "mathedit/basic/casting.hpp"

namespace mathedit
{

namespace
{

std::optional<std::string_view> intern_opt(
  ExprContext & ctx, const std::optional<std::string_view> & s)
{
  if (!s) return std::nullopt;
  return ctx.intern(*s);
}

bool payload_equal(const Expr * a, const Expr * b) noexcept
{
  switch (a->get_kind()) {
    case ExprKind::Literal:
      return cast<LiteralExpr>(a)->text == cast<LiteralExpr>(b)->text;
    case ExprKind::Variable:
      return cast<VariableExpr>(a)->name == cast<VariableExpr>(b)->name;
    case ExprKind::Operator:
      return cast<OperatorExpr>(a)->symbol == cast<OperatorExpr>(b)->symbol;
    case ExprKind::TextRun: {
      const auto * x = cast<TextRunExpr>(a);
      const auto * y = cast<TextRunExpr>(b);
      return x->command == y->command && x->text == y->text;
    }
    case ExprKind::Fraction:
      return cast<FractionExpr>(a)->command == cast<FractionExpr>(b)->command;
    case ExprKind::Function:
      return cast<FunctionExpr>(a)->name == cast<FunctionExpr>(b)->name;
    case ExprKind::Matrix: {
      const auto * x = cast<MatrixExpr>(a);
      const auto * y = cast<MatrixExpr>(b);
      return x->environment == y->environment && x->column_spec == y->column_spec &&
             x->rows == y->rows && x->cols == y->cols;
    }
    case ExprKind::FormatWrapper: {
      const auto * x = cast<FormatWrapperExpr>(a);
      const auto * y = cast<FormatWrapperExpr>(b);
      return x->command == y->command && x->attribute == y->attribute;
    }
    case ExprKind::Integral:
    case ExprKind::Sum:
    case ExprKind::Product:
    case ExprKind::Limit: {
      const auto * x = cast<BigOpExpr>(a);
      const auto * y = cast<BigOpExpr>(b);
      return x->command == y->command && x->has_lower == y->has_lower &&
             x->has_upper == y->has_upper;
    }
    case ExprKind::Placeholder:
    case ExprKind::Root:
    case ExprKind::Power:
    case ExprKind::Subscript:
    case ExprKind::Sequence:
      return true;
  }
  return false;
}

const Expr * replace_rec(
  ExprContext & ctx, const Expr * node, const Path & path, size_t depth, const Expr * replacement)
{
  if (depth == path.size()) {
    return replacement;
  }
  const uint32_t idx = path[depth];
  if (idx >= node->child_count()) {
    return nullptr;
  }
  const Expr * new_child = replace_rec(ctx, node->child(idx), path, depth + 1, replacement);
  if (new_child == nullptr) {
    return nullptr;
  }

  const ExprList old_kids = node->children();
  std::vector<const Expr *> kids(old_kids.begin(), old_kids.end());
  kids[idx] = new_child;
  return rebuild(ctx, node, ctx.list(kids));
}

}  // namespace

std::string to_string(const Path & path)
{
  std::string out = "[";
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += ",";
    out += std::to_string(path[i]);
  }
  out += "]";
  return out;
}

const Expr * node_at(const Expr * root, const Path & path) noexcept
{
  const Expr * cur = root;
  for (const uint32_t idx : path) {
    if (cur == nullptr || idx >= cur->child_count()) {
      return nullptr;
    }
    cur = cur->child(idx);
  }
  return cur;
}

bool is_prefix(const Path & prefix, const Path & path) noexcept
{
  return prefix.size() <= path.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
}

const Expr * rebuild(ExprContext & ctx, const Expr * node, ExprList children)
{
  const SourceRange r = node->get_range();
  switch (node->get_kind()) {
    case ExprKind::Literal:
      return ctx.create<LiteralExpr>(ctx.intern(cast<LiteralExpr>(node)->text), r);
    case ExprKind::Variable:
      return ctx.create<VariableExpr>(ctx.intern(cast<VariableExpr>(node)->name), r);
    case ExprKind::Operator:
      return ctx.create<OperatorExpr>(ctx.intern(cast<OperatorExpr>(node)->symbol), r);
    case ExprKind::TextRun: {
      const auto * n = cast<TextRunExpr>(node);
      return ctx.create<TextRunExpr>(ctx.intern(n->command), ctx.intern(n->text), r);
    }
    case ExprKind::Placeholder:
      return ctx.create<PlaceholderExpr>(r);
    case ExprKind::Fraction:
      return ctx.create<FractionExpr>(ctx.intern(cast<FractionExpr>(node)->command), children, r);
    case ExprKind::Root:
      return ctx.create<RootExpr>(children, r);
    case ExprKind::Power:
      return ctx.create<PowerExpr>(children, r);
    case ExprKind::Subscript:
      return ctx.create<SubscriptExpr>(children, r);
    case ExprKind::Function:
      return ctx.create<FunctionExpr>(ctx.intern(cast<FunctionExpr>(node)->name), children, r);
    case ExprKind::Matrix: {
      const auto * n = cast<MatrixExpr>(node);
      return ctx.create<MatrixExpr>(
        ctx.intern(n->environment), intern_opt(ctx, n->column_spec), n->rows, n->cols, children,
        r);
    }
    case ExprKind::FormatWrapper: {
      const auto * n = cast<FormatWrapperExpr>(node);
      return ctx.create<FormatWrapperExpr>(
        ctx.intern(n->command), intern_opt(ctx, n->attribute), children, r);
    }
    case ExprKind::Sequence:
      return ctx.create<SequenceExpr>(children, r);
    case ExprKind::Integral: {
      const auto * n = cast<BigOpExpr>(node);
      return ctx.create<IntegralExpr>(
        ctx.intern(n->command), n->has_lower, n->has_upper, children, r);
    }
    case ExprKind::Sum: {
      const auto * n = cast<BigOpExpr>(node);
      return ctx.create<SumExpr>(ctx.intern(n->command), n->has_lower, n->has_upper, children, r);
    }
    case ExprKind::Product: {
      const auto * n = cast<BigOpExpr>(node);
      return ctx.create<ProductExpr>(
        ctx.intern(n->command), n->has_lower, n->has_upper, children, r);
    }
    case ExprKind::Limit: {
      const auto * n = cast<BigOpExpr>(node);
      return ctx.create<LimitExpr>(ctx.intern(n->command), n->has_lower, n->has_upper, children, r);
    }
  }
  return nullptr;
}

const Expr * replace_at(
  ExprContext & ctx, const Expr * root, const Path & path, const Expr * replacement)
{
  if (root == nullptr || replacement == nullptr) {
    return nullptr;
  }
  return replace_rec(ctx, root, path, 0, replacement);
}

const Expr * clone_into(ExprContext & ctx, const Expr * node, CloneMemo & memo)
{
  if (node == nullptr) {
    return nullptr;
  }
  auto it = memo.find(node);
  if (it != memo.end()) {
    return it->second;
  }

  std::vector<const Expr *> kids;
  kids.reserve(node->child_count());
  for (const Expr * c : node->children()) {
    kids.push_back(clone_into(ctx, c, memo));
  }
  const Expr * copy = rebuild(ctx, node, ctx.list(kids));
  memo.emplace(node, copy);
  return copy;
}

const Expr * clone_into(ExprContext & ctx, const Expr * node)
{
  CloneMemo memo;
  return clone_into(ctx, node, memo);
}

bool structurally_equal(const Expr * a, const Expr * b) noexcept
{
  if (a == b) return true;
  if (a == nullptr || b == nullptr) return false;
  if (a->get_kind() != b->get_kind()) return false;
  if (a->child_count() != b->child_count()) return false;
  if (!payload_equal(a, b)) return false;

  for (size_t i = 0; i < a->child_count(); ++i) {
    if (!structurally_equal(a->child(i), b->child(i))) {
      return false;
    }
  }
  return true;
}

uint32_t structural_depth(const Expr * node) noexcept
{
  if (node == nullptr || node->child_count() == 0) {
    return 0;
  }
  uint32_t deepest = 0;
  for (const Expr * c : node->children()) {
    deepest = std::max(deepest, structural_depth(c));
  }
  return deepest + (is_transparent_kind(node->get_kind()) ? 0 : 1);
}

size_t count_nodes(const Expr * node) noexcept
{
  if (node == nullptr) return 0;
  size_t n = 1;
  for (const Expr * c : node->children()) {
    n += count_nodes(c);
  }
  return n;
}

MatrixExtent max_matrix_extent(const Expr * node) noexcept
{
  MatrixExtent ext;
  if (node == nullptr) return ext;
  if (const auto * m = dyn_cast<MatrixExpr>(node)) {
    ext.rows = m->rows;
    ext.cols = m->cols;
  }
  for (const Expr * c : node->children()) {
    const MatrixExtent sub = max_matrix_extent(c);
    ext.rows = std::max(ext.rows, sub.rows);
    ext.cols = std::max(ext.cols, sub.cols);
  }
  return ext;
}

}  // namespace mathedit
