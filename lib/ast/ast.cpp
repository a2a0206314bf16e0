// vfilter/ast/ast.cpp - Node spans, literal coercions, precedence helpers
#include "vfilter/ast/ast.hpp"

#include <cctype>

namespace vfilter
{
namespace
{

[[nodiscard]] bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] Position start_of(const Expr * e) noexcept
{
  return e != nullptr ? e->start() : k_no_position;
}

[[nodiscard]] Position end_of(const Expr * e) noexcept
{
  return e != nullptr ? e->end() : k_no_position;
}

/// Literal class used for list homogeneity: 0 string, 1 number, 2 bool.
[[nodiscard]] int scalar_class(const Literal & lit) noexcept
{
  if (lit.is_string()) return 0;
  if (lit.is_number()) return 1;
  if (lit.is_bool()) return 2;
  return -1;
}

}  // namespace

// ============================================================================
// Spans
// ============================================================================

Position Expr::start() const noexcept
{
  switch (kind) {
    case NodeKind::Ident:
      return cast<Ident>(this)->token.start;
    case NodeKind::Literal:
      return cast<Literal>(this)->token.start;
    case NodeKind::ListLiteral:
      return cast<ListLiteral>(this)->lparen.start;
    case NodeKind::UnaryExpr:
      return cast<UnaryExpr>(this)->op.start;
    case NodeKind::BinaryExpr:
      return start_of(cast<BinaryExpr>(this)->left);
    case NodeKind::IndexExpr:
      return start_of(cast<IndexExpr>(this)->left);
    case NodeKind::ParenExpr:
      return cast<ParenExpr>(this)->lparen.start;
  }
  return k_no_position;
}

Position Expr::end() const noexcept
{
  switch (kind) {
    case NodeKind::Ident:
      return cast<Ident>(this)->token.end;
    case NodeKind::Literal:
      return cast<Literal>(this)->token.end;
    case NodeKind::ListLiteral:
      return cast<ListLiteral>(this)->rparen.end;
    case NodeKind::UnaryExpr:
      return end_of(cast<UnaryExpr>(this)->right);
    case NodeKind::BinaryExpr:
      return end_of(cast<BinaryExpr>(this)->right);
    case NodeKind::IndexExpr:
      return cast<IndexExpr>(this)->rbrack.end;
    case NodeKind::ParenExpr:
      return cast<ParenExpr>(this)->rparen.end;
  }
  return k_no_position;
}

// ============================================================================
// Literal
// ============================================================================

std::optional<double> Literal::as_number() const
{
  if (!is_number()) {
    return std::nullopt;
  }
  return syntax::parse_number(value);
}

std::optional<bool> Literal::as_bool() const
{
  if (token.kind == TokenKind::True && iequals_ascii(value, "true")) {
    return true;
  }
  if (token.kind == TokenKind::False && iequals_ascii(value, "false")) {
    return false;
  }
  return std::nullopt;
}

bool Literal::is_same_kind(const Literal & other) const noexcept
{
  const int mine = scalar_class(*this);
  return mine >= 0 && mine == scalar_class(other);
}

// ============================================================================
// Precedence
// ============================================================================

int precedence_of(const Expr * e)
{
  if (const auto * bin = dyn_cast<BinaryExpr>(e)) {
    return bin->precedence();
  }
  if (const auto * un = dyn_cast<UnaryExpr>(e)) {
    return un->precedence();
  }
  return syntax::k_prec_lowest;
}

bool UnaryExpr::is_right_lower() const
{
  return has_precedence(right) && precedence_of(right) < precedence();
}

bool BinaryExpr::is_left_lower() const
{
  return has_precedence(left) && precedence_of(left) < precedence();
}

bool BinaryExpr::is_right_lower() const
{
  return has_precedence(right) && precedence_of(right) < precedence();
}

const Expr * strip_parens(const Expr * e) noexcept
{
  while (const auto * paren = dyn_cast<ParenExpr>(e)) {
    e = paren->inner;
  }
  return e;
}

}  // namespace vfilter
