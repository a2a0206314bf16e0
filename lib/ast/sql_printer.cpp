// vfilter/ast/sql_printer.cpp
#include "vfilter/ast/sql_printer.hpp"

#include <fmt/core.h>

#include <iterator>
#include <utility>

#include "vfilter/ast/visitor.hpp"

namespace vfilter
{
namespace
{

class SqlPrinter : public ConstAstVisitor<SqlPrinter>
{
public:
  [[nodiscard]] std::string take() { return std::move(out_); }

  void visit_ident(const Ident * node) { out_.append(node->value); }

  void visit_literal(const Literal * node)
  {
    if (node->is_string()) {
      fmt::format_to(std::back_inserter(out_), "'{}'", node->value);
      return;
    }
    out_.append(node->value);
  }

  void visit_list_literal(const ListLiteral * node)
  {
    out_ += '(';
    bool first = true;
    for (const Literal * v : node->values) {
      if (!first) out_ += ',';
      first = false;
      visit(v);
    }
    out_ += ')';
  }

  void visit_unary_expr(const UnaryExpr * node)
  {
    out_.append(syntax::literal(node->op.kind));
    out_ += ' ';
    if (isa<ParenExpr>(node->right)) {
      visit(node->right);
      return;
    }
    out_ += '(';
    visit(node->right);
    out_ += ')';
  }

  void visit_binary_expr(const BinaryExpr * node)
  {
    emit_operand(node->left, node->is_left_lower());
    fmt::format_to(std::back_inserter(out_), " {} ", syntax::literal(node->op.kind));
    emit_operand(node->right, node->is_right_lower());
  }

  void visit_index_expr(const IndexExpr * node)
  {
    visit(node->left);
    out_ += '[';
    visit(node->index);
    out_ += ']';
  }

  void visit_paren_expr(const ParenExpr * node)
  {
    out_ += '(';
    visit(node->inner);
    out_ += ')';
  }

private:
  void emit_operand(const Expr * operand, bool lower)
  {
    if (lower) out_ += '(';
    visit(operand);
    if (lower) out_ += ')';
  }

  std::string out_;
};

}  // namespace

std::string to_sql(const Expr * expr)
{
  SqlPrinter printer;
  printer.visit(expr);
  return printer.take();
}

}  // namespace vfilter
