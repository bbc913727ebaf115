// mathedit/syntax/serializer.hpp - Tree to canonical markup
#pragma once

#include <string>

#include "mathedit/tree/expr.hpp"

namespace mathedit
{

/**
 * Canonical markup for a tree.
 *
 * Output never contains line breaks or comments, always braces command
 * arguments and script arguments, and re-parses to a structurally equal
 * tree. Adjacent items that would otherwise merge into one token ("a" next
 * to "b", "\alpha" next to "x") are separated by braces or a space.
 */
[[nodiscard]] std::string serialize(const Expr * root);

}  // namespace mathedit
