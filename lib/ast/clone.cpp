// vfilter/ast/clone.cpp
#include "vfilter/ast/clone.hpp"

#include <vector>

#include "vfilter/ast/visitor.hpp"

namespace vfilter
{
namespace
{

class Cloner : public ConstAstVisitor<Cloner, Expr *>
{
public:
  explicit Cloner(AstContext & dst) : dst_(dst) {}

  Expr * visit_ident(const Ident * node) { return dst_.create<Ident>(copy(node->token)); }

  Expr * visit_literal(const Literal * node) { return copy_literal(node); }

  Expr * visit_list_literal(const ListLiteral * node)
  {
    std::vector<Literal *> values;
    values.reserve(node->values.size());
    for (const Literal * v : node->values) {
      values.push_back(copy_literal(v));
    }
    return dst_.create<ListLiteral>(
      copy(node->lparen), dst_.copy_to_arena(values), copy(node->rparen));
  }

  Expr * visit_unary_expr(const UnaryExpr * node)
  {
    return dst_.create<UnaryExpr>(copy(node->op), visit(node->right));
  }

  Expr * visit_binary_expr(const BinaryExpr * node)
  {
    Expr * left = visit(node->left);
    Expr * right = visit(node->right);
    return dst_.create<BinaryExpr>(left, copy(node->op), right);
  }

  Expr * visit_index_expr(const IndexExpr * node)
  {
    Expr * left = visit(node->left);
    return dst_.create<IndexExpr>(
      left, copy(node->lbrack), copy_literal(node->index), copy(node->rbrack));
  }

  Expr * visit_paren_expr(const ParenExpr * node)
  {
    return dst_.create<ParenExpr>(copy(node->lparen), visit(node->inner), copy(node->rparen));
  }

private:
  [[nodiscard]] Token copy(Token tok) const
  {
    tok.literal = dst_.intern(tok.literal);
    return tok;
  }

  Literal * copy_literal(const Literal * node)
  {
    if (node == nullptr) {
      return nullptr;
    }
    Literal * lit = dst_.create<Literal>(copy(node->token));
    lit->value = dst_.intern(node->value);
    return lit;
  }

  AstContext & dst_;
};

[[nodiscard]] bool same_token(const Token & a, const Token & b)
{
  return a.kind == b.kind && a.literal == b.literal;
}

}  // namespace

Expr * clone(AstContext & dst, const Expr * expr)
{
  Cloner cloner(dst);
  return cloner.visit(expr);
}

bool equals(const Expr * a, const Expr * b)
{
  if (a == nullptr || b == nullptr) {
    return a == b;
  }
  if (a->get_kind() != b->get_kind()) {
    return false;
  }

  switch (a->get_kind()) {
    case NodeKind::Ident: {
      const auto * x = cast<Ident>(a);
      const auto * y = cast<Ident>(b);
      return same_token(x->token, y->token) && x->value == y->value;
    }
    case NodeKind::Literal: {
      const auto * x = cast<Literal>(a);
      const auto * y = cast<Literal>(b);
      return x->token.kind == y->token.kind && x->value == y->value;
    }
    case NodeKind::ListLiteral: {
      const auto * x = cast<ListLiteral>(a);
      const auto * y = cast<ListLiteral>(b);
      if (x->values.size() != y->values.size()) return false;
      for (size_t i = 0; i < x->values.size(); ++i) {
        if (!equals(x->values[i], y->values[i])) return false;
      }
      return true;
    }
    case NodeKind::UnaryExpr: {
      const auto * x = cast<UnaryExpr>(a);
      const auto * y = cast<UnaryExpr>(b);
      return x->op.kind == y->op.kind && equals(x->right, y->right);
    }
    case NodeKind::BinaryExpr: {
      const auto * x = cast<BinaryExpr>(a);
      const auto * y = cast<BinaryExpr>(b);
      return x->op.kind == y->op.kind && equals(x->left, y->left) && equals(x->right, y->right);
    }
    case NodeKind::IndexExpr: {
      const auto * x = cast<IndexExpr>(a);
      const auto * y = cast<IndexExpr>(b);
      return equals(x->left, y->left) && equals(x->index, y->index);
    }
    case NodeKind::ParenExpr:
      return equals(cast<ParenExpr>(a)->inner, cast<ParenExpr>(b)->inner);
  }
  return false;
}

}  // namespace vfilter
