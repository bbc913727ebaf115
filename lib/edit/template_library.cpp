// mathedit/edit/template_library.cpp - Validated toolbar templates
#include "mathedit/edit/template_library.hpp"

#include <fmt/format.h>

#include "mathedit/edit/placeholder_manager.hpp"
#include "mathedit/syntax/frontend.hpp"

namespace mathedit
{

TemplateLibrary::TemplateLibrary() : ctx_(std::make_unique<ExprContext>()) {}

std::vector<TemplateConfig> TemplateLibrary::builtin_templates()
{
  return {
    {"fraction", "\\frac{}{}"},
    {"sqrt", "\\sqrt{}"},
    {"nth_root", "\\sqrt[{}]{}"},
    {"power", "{}^{}"},
    {"subscript", "{}_{}"},
    {"integral", "\\int{}"},
    {"definite_integral", "\\int_{}^{}{}"},
    {"sum", "\\sum_{}^{}{}"},
    {"product", "\\prod_{}^{}{}"},
    {"limit", "\\lim_{}{}"},
    {"matrix2", "\\begin{pmatrix}{} & {} \\\\ {} & {}\\end{pmatrix}"},
    {"bold", "\\mathbf{}"},
    {"color", "\\textcolor{red}{}"},
  };
}

DiagnosticBag TemplateLibrary::load(
  const std::vector<TemplateConfig> & entries, const Validator & validator)
{
  ctx_ = std::make_unique<ExprContext>();
  templates_.clear();

  DiagnosticBag rejected;
  for (const auto & entry : entries) {
    if (find(entry.name) != nullptr) {
      rejected.report_error(SourceRange{}, fmt::format("duplicate template name '{}'", entry.name));
      continue;
    }

    auto checked = validator.validate(entry.markup);
    if (!checked) {
      for (const auto & error : checked.error()) {
        rejected.report(
          error.kind, SourceRange{}, fmt::format("template '{}': {}", entry.name, error.message));
      }
      continue;
    }

    ParseOutput parsed = parse_markup(*ctx_, *checked);
    if (!parsed.ok()) {
      for (const auto & d : parsed.diagnostics.errors()) {
        Diagnostic copy = d;
        copy.message = fmt::format("template '{}': {}", entry.name, d.message);
        copy.labels.clear();
        rejected.add(std::move(copy));
      }
      continue;
    }

    ToolbarTemplate tpl;
    tpl.name = entry.name;
    tpl.markup = std::move(*checked);
    tpl.tree = parsed.root;
    tpl.placeholder_count = enumerate_placeholders(parsed.root).size();
    templates_.push_back(std::move(tpl));
  }
  return rejected;
}

const ToolbarTemplate * TemplateLibrary::find(std::string_view name) const
{
  for (const auto & tpl : templates_) {
    if (tpl.name == name) {
      return &tpl;
    }
  }
  return nullptr;
}

}  // namespace mathedit
