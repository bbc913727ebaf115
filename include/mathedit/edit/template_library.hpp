// mathedit/edit/template_library.hpp - Validated toolbar templates
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/config/engine_config.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"
#include "mathedit/validate/validator.hpp"

namespace mathedit
{

/// A template that passed validation, with its parsed tree
struct ToolbarTemplate
{
  std::string name;
  std::string markup;  ///< sanitized markup
  const Expr * tree = nullptr;
  size_t placeholder_count = 0;
};

/**
 * Named markup fragments offered by the toolbar.
 *
 * Every entry is validated and parsed before it is offered; entries that
 * fail are reported and skipped. Trees live in the library's own arena and
 * are cloned into the editing arena on insertion.
 */
class TemplateLibrary
{
public:
  TemplateLibrary();

  TemplateLibrary(const TemplateLibrary &) = delete;
  TemplateLibrary & operator=(const TemplateLibrary &) = delete;
  TemplateLibrary(TemplateLibrary &&) noexcept = default;
  TemplateLibrary & operator=(TemplateLibrary &&) noexcept = default;

  /// Fractions, roots, scripts, big operators, a 2x2 matrix and formats
  [[nodiscard]] static std::vector<TemplateConfig> builtin_templates();

  /**
   * Replace the library contents with `entries`.
   *
   * @return one error per rejected entry (duplicate name, validation or
   *         parse failure)
   */
  DiagnosticBag load(const std::vector<TemplateConfig> & entries, const Validator & validator);

  [[nodiscard]] const ToolbarTemplate * find(std::string_view name) const;
  [[nodiscard]] const std::vector<ToolbarTemplate> & templates() const noexcept { return templates_; }
  [[nodiscard]] size_t size() const noexcept { return templates_.size(); }

private:
  std::unique_ptr<ExprContext> ctx_;
  std::vector<ToolbarTemplate> templates_;
};

}  // namespace mathedit
