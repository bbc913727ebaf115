// mathedit/edit/placeholder_manager.hpp - Placeholder enumeration, navigation and filling
#pragma once

#include <optional>
#include <vector>

#include "mathedit/basic/result.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"
#include "mathedit/tree/tree_ops.hpp"
#include "mathedit/validate/validator.hpp"

namespace mathedit
{

/// New root on success; the input tree is never modified
using EditResult = Result<const Expr *, std::vector<ValidationError>>;

/// Every Placeholder under `root`, depth-first and left to right
[[nodiscard]] std::vector<Path> enumerate_placeholders(const Expr * root);

/**
 * Placeholder navigation and placeholder-targeted edits over one tree.
 *
 * Navigation wraps around in both directions. Edits are path-copying: they
 * return a new root and reject any result the validator would refuse, so
 * depth and matrix size never exceed the limits after an edit.
 */
class PlaceholderManager
{
public:
  explicit PlaceholderManager(const Validator & validator) : validator_(validator) {}

  /// Recompute the placeholder sequence for a new root
  void reset(const Expr * root) { placeholders_ = enumerate_placeholders(root); }

  [[nodiscard]] const std::vector<Path> & placeholders() const noexcept { return placeholders_; }
  [[nodiscard]] bool empty() const noexcept { return placeholders_.empty(); }

  /**
   * Placeholder after `current`, wrapping to the first one.
   *
   * A `current` that is not a placeholder path moves to the first
   * placeholder. Returns nullopt when there are none.
   */
  [[nodiscard]] std::optional<Path> next(const std::optional<Path> & current) const;

  /// Mirror of next(); an unknown `current` moves to the last placeholder
  [[nodiscard]] std::optional<Path> previous(const std::optional<Path> & current) const;

  /**
   * Replace the node at `path` (normally a Placeholder) with a copy of
   * `replacement`.
   *
   * Errors: InvalidPath, or the validator's TooDeep / MatrixTooLarge / TooLong.
   */
  [[nodiscard]] EditResult fill(
    ExprContext & ctx, const Expr * root, const Path & path, const Expr * replacement) const;

  /**
   * Insert `subtree` at `path`.
   *
   * A Placeholder target is filled. A target inside a Sequence gets the
   * subtree as its next sibling, a Sequence target gets it appended, and any
   * other target is wrapped in a Sequence followed by the subtree.
   */
  [[nodiscard]] EditResult insert(
    ExprContext & ctx, const Expr * root, const Path & path, const Expr * subtree) const;

  /// Wrap the node at `path` in `wrapper`'s kind and payload (wrapper's children are ignored)
  [[nodiscard]] EditResult wrap(
    ExprContext & ctx, const Expr * root, const Path & path, const Expr * wrapper) const;

private:
  [[nodiscard]] EditResult checked(const Expr * new_root) const;

  const Validator & validator_;
  std::vector<Path> placeholders_;
};

}  // namespace mathedit
