// mathedit/validate/validator.cpp - Complexity and security gate
#include "mathedit/validate/validator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <set>

#include "mathedit/syntax/frontend.hpp"
#include "mathedit/syntax/scanner.hpp"
#include "mathedit/syntax/serializer.hpp"
#include "mathedit/tree/expr_context.hpp"
#include "mathedit/tree/tree_ops.hpp"
#include "mathedit/validate/patterns.hpp"

namespace mathedit
{

Diagnostic to_diagnostic(const ValidationError & error)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(error_code(error.kind));
  d.message = error.message;
  if (error.range.is_valid()) {
    d.labels.push_back(Label{error.range, error.subject, LabelStyle::Primary});
  }
  return d;
}

ValidationResult Validator::validate(std::string_view markup) const
{
  auto errors = inspect(markup);
  if (!errors.empty()) {
    return errors;
  }
  return sanitize(markup);
}

std::vector<ValidationError> Validator::inspect(std::string_view markup) const
{
  std::vector<ValidationError> out;

  const auto too_long = check_length(markup);
  if (too_long) {
    out.push_back(*too_long);
  }

  check_patterns(markup, out);
  check_commands(markup, out);

  // Building a tree from hostile-length input is what the length limit prevents
  if (!too_long) {
    check_structure(markup, out);
  }
  return out;
}

std::vector<ValidationError> Validator::validate_tree(const Expr * root) const
{
  std::vector<ValidationError> out;
  check_tree(root, out);

  if (auto too_long = check_length(serialize(root))) {
    out.push_back(std::move(*too_long));
  }
  return out;
}

std::optional<ValidationError> Validator::check_length(std::string_view markup) const
{
  if (markup.size() <= limits_.max_length) {
    return std::nullopt;
  }
  return ValidationError{
    ErrorKind::TooLong,
    fmt::format("formula too long (max {} characters, got {})", limits_.max_length, markup.size()),
    SourceRange{}, ""};
}

std::string Validator::sanitize(std::string_view markup)
{
  return PatternSet::builtin().sanitize(markup);
}

void Validator::check_patterns(std::string_view markup, std::vector<ValidationError> & out) const
{
  for (const PatternMatch & m : PatternSet::builtin().find(markup)) {
    out.push_back(ValidationError{
      ErrorKind::UnsafeContent,
      fmt::format("formula contains unsafe content ({}): '{}'", to_string(m.pattern_class), m.text),
      m.range, std::string(to_string(m.pattern_class))});
  }
}

void Validator::check_commands(std::string_view markup, std::vector<ValidationError> & out) const
{
  std::set<std::string_view> reported;
  for (const syntax::Token & t : syntax::scan(markup)) {
    const bool is_env =
      t.kind == syntax::TokenKind::EnvironmentBegin || t.kind == syntax::TokenKind::EnvironmentEnd;
    if (t.kind != syntax::TokenKind::Command && !is_env) {
      continue;
    }
    if (policy_.is_allowed(t.text) || !reported.insert(t.text).second) {
      continue;
    }

    const std::string_view what = is_env ? "environment" : "command";
    const std::string shown = is_env ? std::string(t.text) : "\\" + std::string(t.text);
    out.push_back(ValidationError{
      ErrorKind::DisallowedCommand,
      fmt::format(
        "{} '{}' is {}", what, shown, policy_.is_denied(t.text) ? "forbidden" : "not allowed"),
      t.range, std::string(t.text)});
  }
}

void Validator::check_structure(std::string_view markup, std::vector<ValidationError> & out) const
{
  ExprContext ctx;
  const ParseOutput parsed = parse_markup(ctx, markup);

  bool builder_too_deep = false;
  for (const Diagnostic & d : parsed.diagnostics) {
    const auto kind = d.kind();
    if (!kind) {
      continue;
    }
    if (*kind == ErrorKind::TooDeep) {
      builder_too_deep = true;
      continue;
    }
    const Label * label = d.primary_label();
    out.push_back(ValidationError{*kind, d.message, d.primary_range(), label ? label->message : ""});
  }

  const size_t before = out.size();
  check_tree(parsed.root, out);

  const bool depth_reported =
    std::any_of(out.begin() + static_cast<std::ptrdiff_t>(before), out.end(), [](const auto & e) {
      return e.kind == ErrorKind::TooDeep;
    });
  if (builder_too_deep && !depth_reported) {
    out.push_back(ValidationError{
      ErrorKind::TooDeep,
      fmt::format("formula too deeply nested (max {} levels)", limits_.max_nesting_depth),
      SourceRange{}, ""});
  }
}

void Validator::check_tree(const Expr * root, std::vector<ValidationError> & out) const
{
  const uint32_t depth = structural_depth(root);
  if (depth > limits_.max_nesting_depth) {
    out.push_back(ValidationError{
      ErrorKind::TooDeep,
      fmt::format(
        "formula too deeply nested (max {} levels, got {})", limits_.max_nesting_depth, depth),
      SourceRange{}, ""});
  }

  const MatrixExtent ext = max_matrix_extent(root);
  if (ext.rows > limits_.max_rows || ext.cols > limits_.max_cols) {
    out.push_back(ValidationError{
      ErrorKind::MatrixTooLarge,
      fmt::format(
        "matrix too large (max {}x{}, got {}x{})", limits_.max_rows, limits_.max_cols, ext.rows,
        ext.cols),
      SourceRange{}, ""});
  }
}

}  // namespace mathedit
