// vfilter/ast/filter_builder.cpp
#include "vfilter/ast/filter_builder.hpp"

#include <fmt/core.h>

#include <utility>

#include "vfilter/basic/casting.hpp"

namespace vfilter
{

BuildResult FilterBuilder::build() const
{
  if (err_) {
    return BuildResult{nullptr, err_};
  }
  return BuildResult{root_, std::nullopt};
}

// ============================================================================
// Checks on the nodes a call produced
// ============================================================================

Expr * FilterBuilder::checked(BinaryExpr * cond)
{
  if (!check_field(cond->left)) {
    return nullptr;
  }
  if (cond->right == nullptr) {
    fail(ErrorTag::NilExpression, fmt::format("value of '{}' is null", cond->op.literal));
    return nullptr;
  }
  if (!check_value(cond->right)) {
    return nullptr;
  }
  return cond;
}

bool FilterBuilder::check_field(const Expr * field)
{
  if (field == nullptr) {
    fail(ErrorTag::NilExpression, "field is null");
    return false;
  }
  if (isa<Ident>(field)) {
    return true;
  }
  if (const auto * ix = dyn_cast<IndexExpr>(field)) {
    return check_literal(ix->index) && check_field(ix->left);
  }
  fail(
    ErrorTag::ComparisonLeftShape,
    fmt::format("field must be a name or an index chain, got {}", to_string(field->get_kind())));
  return false;
}

bool FilterBuilder::check_value(const Expr * value)
{
  if (const auto * lit = dyn_cast<Literal>(value)) {
    return check_literal(lit);
  }
  if (const auto * list = dyn_cast<ListLiteral>(value)) {
    for (const Literal * element : list->values) {
      if (!check_literal(element)) {
        return false;
      }
    }
  }
  return true;
}

// ERROR literals carry the reason the value could not be converted
bool FilterBuilder::check_literal(const Literal * lit)
{
  if (lit == nullptr) {
    fail(ErrorTag::NilExpression, "literal is null");
    return false;
  }
  if (lit->token.kind == TokenKind::Error) {
    fail(ErrorTag::UnsupportedLiteralKind, std::string(lit->token.literal));
    return false;
  }
  return true;
}

// ============================================================================
// Joining
// ============================================================================

void FilterBuilder::join(TokenKind op, Expr * cond)
{
  if (cond == nullptr) {
    return;
  }
  root_ = (root_ == nullptr) ? cond : nodes_.binary(op, root_, cond);
}

FilterBuilder & FilterBuilder::join_scope(TokenKind op, const Scope & fill)
{
  if (err_) {
    return *this;
  }

  FilterBuilder sub(nodes_.context());
  fill(sub);
  if (sub.err_) {
    err_ = std::move(sub.err_);
    return *this;
  }

  if (op == TokenKind::Not) {
    if (sub.root_ == nullptr) {
      fail(ErrorTag::NilExpression, "not scope added no conditions");
      return *this;
    }
    join(TokenKind::And, nodes_.not_(sub.root_));
    return *this;
  }

  join(op, sub.root_);
  return *this;
}

void FilterBuilder::fail(ErrorTag tag, std::string detail)
{
  if (!err_) {
    err_ = FilterError(tag, std::move(detail));
  }
}

}  // namespace vfilter
