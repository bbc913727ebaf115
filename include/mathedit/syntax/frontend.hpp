// mathedit/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string_view>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"

namespace mathedit
{

struct ParseOutput
{
  const Expr * root = nullptr;  ///< never null; a partial tree when diagnostics has errors
  DiagnosticBag diagnostics;

  [[nodiscard]] bool ok() const { return !diagnostics.has_errors(); }
};

// Parse pipeline:
// markup -> scanner (token stream) -> recursive-descent builder (tree) -> diagnostics
[[nodiscard]] ParseOutput parse_markup(ExprContext & ctx, std::string_view markup);

}  // namespace mathedit
