// mathedit/edit/history.hpp - Undo/redo over immutable roots
#pragma once

#include <cstddef>
#include <deque>
#include <vector>

#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/tree_ops.hpp"

namespace mathedit
{

/**
 * Bounded undo/redo stacks of prior canonical roots.
 *
 * Roots are immutable, so a history entry is just a pointer into the
 * arena. The oldest entry is dropped once `depth` is reached.
 */
class History
{
public:
  static constexpr size_t k_default_depth = 50;

  explicit History(size_t depth = k_default_depth) : depth_(depth) {}

  /// Record `previous` before a new root replaces it; clears the redo stack
  void push(const Expr * previous);

  /// Root to restore, or nullptr if there is nothing to undo
  [[nodiscard]] const Expr * undo(const Expr * current);
  [[nodiscard]] const Expr * redo(const Expr * current);

  [[nodiscard]] bool can_undo() const noexcept { return !undo_.empty(); }
  [[nodiscard]] bool can_redo() const noexcept { return !redo_.empty(); }
  [[nodiscard]] size_t depth() const noexcept { return depth_; }
  [[nodiscard]] size_t undo_size() const noexcept { return undo_.size(); }

  void clear();

  /// Every root held, undo entries first
  [[nodiscard]] std::vector<const Expr *> roots() const;

  /// Rewrite all entries after an arena move
  void remap(const CloneMemo & memo);

private:
  size_t depth_;
  std::deque<const Expr *> undo_;
  std::deque<const Expr *> redo_;
};

}  // namespace mathedit
