// vfilter/ast/builder.cpp
#include "vfilter/ast/builder.hpp"

namespace vfilter
{

using syntax::make_ident_token;
using syntax::make_kind_token;
using syntax::make_literal_token;

Ident * ExprBuilder::ident(std::string_view name)
{
  return ctx_.create<Ident>(make_ident_token(ctx_.intern(name)));
}

Literal * ExprBuilder::literal(bool value)
{
  return ctx_.create<Literal>(make_kind_token(value ? TokenKind::True : TokenKind::False));
}

Literal * ExprBuilder::literal(std::string_view value)
{
  return ctx_.create<Literal>(make_literal_token(ctx_, TokenKind::String, value));
}

Literal * ExprBuilder::number_literal(std::string_view text)
{
  return ctx_.create<Literal>(make_literal_token(ctx_, TokenKind::Number, text));
}

ListLiteral * ExprBuilder::list(const std::vector<Literal *> & values)
{
  return ctx_.create<ListLiteral>(
    make_kind_token(TokenKind::LParen), ctx_.copy_to_arena(values),
    make_kind_token(TokenKind::RParen));
}

BinaryExpr * ExprBuilder::binary(TokenKind op, Expr * left, Expr * right)
{
  return ctx_.create<BinaryExpr>(left, make_kind_token(op), right);
}

UnaryExpr * ExprBuilder::unary(TokenKind op, Expr * operand)
{
  return ctx_.create<UnaryExpr>(make_kind_token(op), operand);
}

IndexExpr * ExprBuilder::make_index(Expr * base, Literal * key)
{
  return ctx_.create<IndexExpr>(
    base, make_kind_token(TokenKind::LBrack), key, make_kind_token(TokenKind::RBrack));
}

ParenExpr * ExprBuilder::paren(Expr * inner)
{
  return ctx_.create<ParenExpr>(
    make_kind_token(TokenKind::LParen), inner, make_kind_token(TokenKind::RParen));
}

}  // namespace vfilter
