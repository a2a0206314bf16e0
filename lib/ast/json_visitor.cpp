// vfilter/ast/json_visitor.cpp - JSON serialization implementation
//
#include "vfilter/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "vfilter/ast/visitor.hpp"
#include "vfilter/basic/casting.hpp"
#include "vfilter/basic/source_manager.hpp"

namespace vfilter
{
namespace
{

using nlohmann::json;

json j_range(const Expr * e)
{
  const Position start = e->start();
  if (!start.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", start.to_string()}, {"end", e->end().to_string()}};
}

json j_literal_value(const Literal * lit)
{
  if (lit->is_bool()) {
    if (const auto b = lit->as_bool()) return *b;
  }
  if (lit->is_number()) {
    if (const auto n = lit->as_number()) return *n;
  }
  return std::string(lit->value);
}

class JsonVisitor : public ConstAstVisitor<JsonVisitor, json>
{
public:
  json visit_ident(const Ident * node)
  {
    return json{{"type", "Ident"}, {"range", j_range(node)}, {"name", std::string(node->value)}};
  }

  json visit_literal(const Literal * node)
  {
    return json{
      {"type", "Literal"},
      {"range", j_range(node)},
      {"kind", std::string(syntax::name(node->token.kind))},
      {"text", std::string(node->value)},
      {"value", j_literal_value(node)}};
  }

  json visit_list_literal(const ListLiteral * node)
  {
    json values = json::array();
    for (const Literal * v : node->values) {
      values.push_back(visit(v));
    }
    return json{{"type", "ListLiteral"}, {"range", j_range(node)}, {"values", values}};
  }

  json visit_unary_expr(const UnaryExpr * node)
  {
    return json{
      {"type", "UnaryExpr"},
      {"range", j_range(node)},
      {"op", std::string(syntax::literal(node->op.kind))},
      {"operand", visit(node->right)}};
  }

  json visit_binary_expr(const BinaryExpr * node)
  {
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(node)},
      {"op", std::string(syntax::literal(node->op.kind))},
      {"lhs", visit(node->left)},
      {"rhs", visit(node->right)}};
  }

  json visit_index_expr(const IndexExpr * node)
  {
    return json{
      {"type", "IndexExpr"},
      {"range", j_range(node)},
      {"base", visit(node->left)},
      {"index", visit(node->index)}};
  }

  json visit_paren_expr(const ParenExpr * node)
  {
    return json{{"type", "ParenExpr"}, {"range", j_range(node)}, {"inner", visit(node->inner)}};
  }
};

}  // namespace

json to_json(const Expr * node)
{
  JsonVisitor v;
  return v.visit(node);
}

}  // namespace vfilter
