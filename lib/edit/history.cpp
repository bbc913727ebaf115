// mathedit/edit/history.cpp - Undo/redo over immutable roots
#include "mathedit/edit/history.hpp"

#include <initializer_list>

namespace mathedit
{

void History::push(const Expr * previous)
{
  redo_.clear();
  if (depth_ == 0 || previous == nullptr) {
    return;
  }
  undo_.push_back(previous);
  while (undo_.size() > depth_) {
    undo_.pop_front();
  }
}

const Expr * History::undo(const Expr * current)
{
  if (undo_.empty()) {
    return nullptr;
  }
  const Expr * root = undo_.back();
  undo_.pop_back();
  redo_.push_back(current);
  return root;
}

const Expr * History::redo(const Expr * current)
{
  if (redo_.empty()) {
    return nullptr;
  }
  const Expr * root = redo_.back();
  redo_.pop_back();
  undo_.push_back(current);
  return root;
}

void History::clear()
{
  undo_.clear();
  redo_.clear();
}

std::vector<const Expr *> History::roots() const
{
  std::vector<const Expr *> out(undo_.begin(), undo_.end());
  out.insert(out.end(), redo_.begin(), redo_.end());
  return out;
}

void History::remap(const CloneMemo & memo)
{
  for (auto * stack : {&undo_, &redo_}) {
    for (auto & root : *stack) {
      auto it = memo.find(root);
      if (it != memo.end()) {
        root = it->second;
      }
    }
  }
}

}  // namespace mathedit
