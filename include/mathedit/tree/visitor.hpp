// mathedit/tree/visitor.hpp - CRTP visitor over expression trees
//
// Dispatch is generated from expr_nodes.def, so adding a node kind without a
// visit method is a compile-time error in every exhaustive visitor.
//
#pragma once

#include "mathedit/basic/casting.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/node_kind.hpp"

namespace mathedit
{

// ============================================================================
// ExprVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for expression trees.
 *
 * Nodes are immutable, so every visit method takes a const pointer.
 * Unhandled kinds fall back to the category method (visit_leaf,
 * visit_structure, visit_big_op) and then to visit_expr.
 *
 * Usage:
 * @code
 *   class CountFractions : public ExprVisitor<CountFractions, int> {
 *   public:
 *     int visit_fraction(const FractionExpr *) { return 1; }
 *     int visit_expr(const Expr *) { return 0; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 */
template <typename Derived, typename ReturnType = void>
class ExprVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /**
   * Visit a node, dispatching to the visit method for its kind.
   */
  ReturnType visit(const Expr * node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define EXPR_NODE_LEAF(Class, Kind, Snake) \
  case ExprKind::Kind:                     \
    return get_derived().visit_##Snake(cast<Class>(node));
#define EXPR_NODE_STRUCT(Class, Kind, Snake) \
  case ExprKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define EXPR_NODE_BIG_OP(Class, Kind, Snake) \
  case ExprKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "mathedit/tree/expr_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods
  // ===========================================================================

#define EXPR_NODE_LEAF(Class, Kind, Snake) \
  ReturnType visit_##Snake(const Class * node) { return get_derived().visit_leaf(node); }
#include "mathedit/tree/expr_nodes.def"

#define EXPR_NODE_STRUCT(Class, Kind, Snake) \
  ReturnType visit_##Snake(const Class * node) { return get_derived().visit_structure(node); }
#include "mathedit/tree/expr_nodes.def"

#define EXPR_NODE_BIG_OP(Class, Kind, Snake) \
  ReturnType visit_##Snake(const Class * node) { return get_derived().visit_big_op(node); }
#include "mathedit/tree/expr_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_leaf(const Expr * node) { return get_derived().visit_expr(node); }
  ReturnType visit_structure(const Expr * node) { return get_derived().visit_expr(node); }
  ReturnType visit_big_op(const BigOpExpr * node) { return get_derived().visit_expr(node); }

  /// Base case - does nothing by default
  ReturnType visit_expr(const Expr * /*node*/) { return ReturnType(); }
};

// ============================================================================
// RecursiveExprVisitor - Traverses children automatically
// ============================================================================

/**
 * Pre-order traversal over every node.
 *
 * Override `pre_visit` to act on each node. Return false from it to prune
 * the subtree, or from `visit` to stop the whole walk.
 */
template <typename Derived>
class RecursiveExprVisitor : public ExprVisitor<Derived, bool>
{
  using Base = ExprVisitor<Derived, bool>;

public:
  using Base::get_derived;

  bool visit_expr(const Expr * node)
  {
    if (!get_derived().pre_visit(node)) {
      return true;
    }
    for (const Expr * c : node->children()) {
      if (!get_derived().visit(c)) return false;
    }
    return true;
  }

  /// Return false to skip this node's children
  bool pre_visit(const Expr * /*node*/) { return true; }
};

}  // namespace mathedit
