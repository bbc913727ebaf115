// mathedit/tree/json_visitor.cpp - JSON serialization implementation
//
#include "mathedit/tree/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "mathedit/basic/casting.hpp"
#include "mathedit/basic/source_manager.hpp"
#include "mathedit/tree/visitor.hpp"

namespace mathedit
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

class JsonBuilder : public ExprVisitor<JsonBuilder, json>
{
public:
  json visit_literal(const LiteralExpr * n)
  {
    json j = head(n);
    j["text"] = std::string(n->text);
    return j;
  }

  json visit_variable(const VariableExpr * n)
  {
    json j = head(n);
    j["name"] = std::string(n->name);
    return j;
  }

  json visit_operator(const OperatorExpr * n)
  {
    json j = head(n);
    j["symbol"] = std::string(n->symbol);
    return j;
  }

  json visit_text_run(const TextRunExpr * n)
  {
    json j = head(n);
    j["command"] = std::string(n->command);
    j["text"] = std::string(n->text);
    return j;
  }

  json visit_placeholder(const PlaceholderExpr * n) { return head(n); }

  json visit_fraction(const FractionExpr * n)
  {
    json j = head(n);
    j["command"] = std::string(n->command);
    j["children"] = children(n);
    return j;
  }

  json visit_function(const FunctionExpr * n)
  {
    json j = head(n);
    j["name"] = std::string(n->name);
    j["children"] = children(n);
    return j;
  }

  json visit_matrix(const MatrixExpr * n)
  {
    json j = head(n);
    j["environment"] = std::string(n->environment);
    j["rows"] = n->rows;
    j["cols"] = n->cols;
    if (n->column_spec) {
      j["columnSpec"] = std::string(*n->column_spec);
    }
    // Cells as a list of rows
    json rows = json::array();
    for (uint32_t r = 0; r < n->rows; ++r) {
      json row = json::array();
      for (uint32_t c = 0; c < n->cols; ++c) {
        row.push_back(visit(n->cell(r, c)));
      }
      rows.push_back(std::move(row));
    }
    j["cells"] = std::move(rows);
    return j;
  }

  json visit_format_wrapper(const FormatWrapperExpr * n)
  {
    json j = head(n);
    j["command"] = std::string(n->command);
    j["attribute"] = n->attribute ? json(std::string(*n->attribute)) : json(nullptr);
    j["children"] = children(n);
    return j;
  }

  json visit_big_op(const BigOpExpr * n)
  {
    json j = head(n);
    j["command"] = std::string(n->command);
    j["lower"] = n->has_lower ? visit(n->lower()) : json(nullptr);
    j["upper"] = n->has_upper ? visit(n->upper()) : json(nullptr);
    j["operand"] = visit(n->operand());
    return j;
  }

  // Root, Power, Subscript, Sequence
  json visit_structure(const Expr * n)
  {
    json j = head(n);
    j["children"] = children(n);
    return j;
  }

  json visit_expr(const Expr * n) { return head(n); }

private:
  static json head(const Expr * n)
  {
    return json{{"kind", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
  }

  json children(const Expr * n)
  {
    json arr = json::array();
    for (const Expr * c : n->children()) {
      arr.push_back(visit(c));
    }
    return arr;
  }
};

}  // namespace

nlohmann::json to_json(const Expr * node)
{
  if (node == nullptr) {
    return nullptr;
  }
  JsonBuilder builder;
  return builder.visit(node);
}

}  // namespace mathedit
