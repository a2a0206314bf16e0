// vfilter/ast/walk.cpp - Depth-first driver for ExprVisitor
#include "vfilter/ast/visitor.hpp"

namespace vfilter
{

void walk(ExprVisitor & visitor, const Expr * node)
{
  ExprVisitor * const child_visitor = visitor.visit(node);
  if (child_visitor == nullptr || node == nullptr) {
    return;
  }

  switch (node->kind) {
    case NodeKind::Ident:
    case NodeKind::Literal:
      break;
    case NodeKind::ListLiteral:
      for (const Literal * value : cast<ListLiteral>(node)->values) {
        walk(*child_visitor, value);
      }
      break;
    case NodeKind::UnaryExpr:
      walk(*child_visitor, cast<UnaryExpr>(node)->right);
      break;
    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(node);
      walk(*child_visitor, bin->left);
      walk(*child_visitor, bin->right);
      break;
    }
    case NodeKind::IndexExpr: {
      const auto * idx = cast<IndexExpr>(node);
      walk(*child_visitor, idx->left);
      walk(*child_visitor, idx->index);
      break;
    }
    case NodeKind::ParenExpr:
      walk(*child_visitor, cast<ParenExpr>(node)->inner);
      break;
  }
}

}  // namespace vfilter
