// mathedit/edit/placeholder_manager.cpp - Placeholder enumeration, navigation and filling
#include "mathedit/edit/placeholder_manager.hpp"

#include <algorithm>

#include "mathedit/basic/casting.hpp"

namespace mathedit
{
namespace
{

void collect(const Expr * node, Path & path, std::vector<Path> & out)
{
  if (isa<PlaceholderExpr>(node)) {
    out.push_back(path);
    return;
  }
  for (uint32_t i = 0; i < node->child_count(); ++i) {
    path.push_back(i);
    collect(node->child(i), path, out);
    path.pop_back();
  }
}

ValidationError invalid_path(const Path & path)
{
  return ValidationError{
    ErrorKind::InvalidPath, "no node at path " + to_string(path), SourceRange{}, to_string(path)};
}

// Items of a Sequence are spliced in; anything else is one item
void append_items(std::vector<const Expr *> & kids, const Expr * subtree)
{
  if (isa<SequenceExpr>(subtree)) {
    const ExprList items = subtree->children();
    kids.insert(kids.end(), items.begin(), items.end());
  } else {
    kids.push_back(subtree);
  }
}

}  // namespace

std::vector<Path> enumerate_placeholders(const Expr * root)
{
  std::vector<Path> out;
  if (root == nullptr) {
    return out;
  }
  Path path;
  collect(root, path, out);
  return out;
}

std::optional<Path> PlaceholderManager::next(const std::optional<Path> & current) const
{
  if (placeholders_.empty()) {
    return std::nullopt;
  }
  if (current) {
    auto it = std::find(placeholders_.begin(), placeholders_.end(), *current);
    if (it != placeholders_.end()) {
      ++it;
      return it == placeholders_.end() ? placeholders_.front() : *it;
    }
  }
  return placeholders_.front();
}

std::optional<Path> PlaceholderManager::previous(const std::optional<Path> & current) const
{
  if (placeholders_.empty()) {
    return std::nullopt;
  }
  if (current) {
    auto it = std::find(placeholders_.begin(), placeholders_.end(), *current);
    if (it != placeholders_.end()) {
      return it == placeholders_.begin() ? placeholders_.back() : *std::prev(it);
    }
  }
  return placeholders_.back();
}

EditResult PlaceholderManager::fill(
  ExprContext & ctx, const Expr * root, const Path & path, const Expr * replacement) const
{
  if (node_at(root, path) == nullptr || replacement == nullptr) {
    return std::vector<ValidationError>{invalid_path(path)};
  }
  return checked(replace_at(ctx, root, path, clone_into(ctx, replacement)));
}

EditResult PlaceholderManager::insert(
  ExprContext & ctx, const Expr * root, const Path & path, const Expr * subtree) const
{
  const Expr * target = node_at(root, path);
  if (target == nullptr || subtree == nullptr) {
    return std::vector<ValidationError>{invalid_path(path)};
  }
  if (isa<PlaceholderExpr>(target)) {
    return fill(ctx, root, path, subtree);
  }

  const Expr * copy = clone_into(ctx, subtree);

  if (isa<SequenceExpr>(target)) {
    const ExprList items = target->children();
    std::vector<const Expr *> kids(items.begin(), items.end());
    append_items(kids, copy);
    return checked(replace_at(ctx, root, path, rebuild(ctx, target, ctx.list(kids))));
  }

  if (!path.empty()) {
    const Path parent_path(path.begin(), path.end() - 1);
    const Expr * parent = node_at(root, parent_path);
    if (isa<SequenceExpr>(parent)) {
      const ExprList old_kids = parent->children();
      std::vector<const Expr *> kids(old_kids.begin(), old_kids.begin() + path.back() + 1);
      append_items(kids, copy);
      kids.insert(kids.end(), old_kids.begin() + path.back() + 1, old_kids.end());
      return checked(replace_at(ctx, root, parent_path, rebuild(ctx, parent, ctx.list(kids))));
    }
  }

  std::vector<const Expr *> kids{target};
  append_items(kids, copy);
  const Expr * seq = ctx.create<SequenceExpr>(ctx.list(kids));
  return checked(replace_at(ctx, root, path, seq));
}

EditResult PlaceholderManager::wrap(
  ExprContext & ctx, const Expr * root, const Path & path, const Expr * wrapper) const
{
  const Expr * target = node_at(root, path);
  if (target == nullptr || wrapper == nullptr || wrapper->child_count() != 1) {
    return std::vector<ValidationError>{invalid_path(path)};
  }
  return checked(replace_at(ctx, root, path, rebuild(ctx, wrapper, ctx.list({target}))));
}

EditResult PlaceholderManager::checked(const Expr * new_root) const
{
  if (new_root == nullptr) {
    return std::vector<ValidationError>{invalid_path({})};
  }
  auto errors = validator_.validate_tree(new_root);
  if (!errors.empty()) {
    return errors;
  }
  return new_root;
}

}  // namespace mathedit
