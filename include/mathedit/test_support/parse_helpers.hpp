// mathedit/test_support/parse_helpers.hpp - helpers for unit tests
//
// Keeps the arena and the markup together so trees and diagnostics stay
// valid for the whole test.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/basic/source_manager.hpp"
#include "mathedit/syntax/frontend.hpp"
#include "mathedit/syntax/serializer.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"

namespace mathedit::test_support
{

struct TestParseUnit
{
  SourceManager source;
  std::unique_ptr<ExprContext> ctx;
  DiagnosticBag diags;
  const Expr * root = nullptr;

  [[nodiscard]] bool ok() const { return !diags.has_errors(); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    if (r.is_invalid()) return {};
    return source.get_source().substr(r.get_begin().get_offset(), r.size());
  }
};

[[nodiscard]] inline TestParseUnit parse(std::string markup)
{
  TestParseUnit out;
  out.ctx = std::make_unique<ExprContext>();
  out.source = SourceManager("<test>", std::move(markup));

  ParseOutput parsed = parse_markup(*out.ctx, out.source.get_source());
  out.diags = std::move(parsed.diagnostics);
  out.root = parsed.root;
  return out;
}

/// Parse and serialize in one step
[[nodiscard]] inline std::string reformat(const std::string & markup)
{
  const TestParseUnit unit = parse(markup);
  return serialize(unit.root);
}

}  // namespace mathedit::test_support
