// mathedit/tree/tree_ops.hpp - Paths, path copying and structural queries
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"

namespace mathedit
{

/// Child indices from the root to a node; the empty path is the root itself.
using Path = std::vector<uint32_t>;

[[nodiscard]] std::string to_string(const Path & path);

/// Node at `path`, or nullptr if the path leaves the tree.
[[nodiscard]] const Expr * node_at(const Expr * root, const Path & path) noexcept;

/// True if `prefix` is an ancestor-or-self path of `path`.
[[nodiscard]] bool is_prefix(const Path & prefix, const Path & path) noexcept;

/**
 * Create a node with the kind and payload of `node` but new children.
 *
 * Payload strings are interned into `ctx`, so this also moves a node
 * between arenas. Child count must fit the kind (a Matrix keeps its
 * rows x cols shape).
 */
[[nodiscard]] const Expr * rebuild(ExprContext & ctx, const Expr * node, ExprList children);

/**
 * Path-copying replacement: returns a new root where the node at `path` is
 * `replacement`. Every node off the path is shared with `root`.
 *
 * @return nullptr if `path` does not exist in `root`
 */
[[nodiscard]] const Expr * replace_at(
  ExprContext & ctx, const Expr * root, const Path & path, const Expr * replacement);

/// Mapping from nodes of a source arena to their copies in a target arena
using CloneMemo = std::unordered_map<const Expr *, const Expr *>;

/**
 * Deep-copy a tree into `ctx`.
 *
 * Nodes already in `memo` are reused, so cloning several roots that share
 * subtrees with one memo keeps them shared in the copy.
 */
[[nodiscard]] const Expr * clone_into(ExprContext & ctx, const Expr * node, CloneMemo & memo);

[[nodiscard]] const Expr * clone_into(ExprContext & ctx, const Expr * node);

/// Same kinds, payloads and children; source ranges are ignored.
[[nodiscard]] bool structurally_equal(const Expr * a, const Expr * b) noexcept;

/**
 * Structural depth: the largest number of ancestors on any root-to-leaf
 * path that are neither Sequence nor Literal. A leaf alone has depth 0,
 * `\frac{a}{b}` has depth 1.
 */
[[nodiscard]] uint32_t structural_depth(const Expr * node) noexcept;

[[nodiscard]] size_t count_nodes(const Expr * node) noexcept;

/// Largest matrix found in the tree
struct MatrixExtent
{
  uint32_t rows = 0;
  uint32_t cols = 0;
};

[[nodiscard]] MatrixExtent max_matrix_extent(const Expr * node) noexcept;

}  // namespace mathedit
