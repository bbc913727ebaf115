// mathedit/syntax/frontend.cpp - High-level parse pipeline
#include "mathedit/syntax/frontend.hpp"

#include "mathedit/syntax/parser.hpp"
#include "mathedit/syntax/scanner.hpp"

namespace mathedit
{

ParseOutput parse_markup(ExprContext & ctx, std::string_view markup)
{
  ParseOutput out;
  syntax::Parser parser(ctx, markup, out.diagnostics, syntax::scan(markup));
  out.root = parser.parse_formula();
  return out;
}

}  // namespace mathedit
