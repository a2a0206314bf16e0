// vfilter/sema/analyzer.cpp - Semantic validation rules
#include "vfilter/sema/analyzer.hpp"

#include <fmt/core.h>

#include <utility>

#include "vfilter/syntax/keywords.hpp"

namespace vfilter
{
namespace
{

[[nodiscard]] std::string_view kind_name(const Expr * e)
{
  return e == nullptr ? std::string_view("null") : to_string(e->get_kind());
}

[[nodiscard]] std::string_view scalar_class_name(const Literal & lit)
{
  if (lit.is_string()) return "string";
  if (lit.is_number()) return "number";
  if (lit.is_bool()) return "bool";
  return syntax::name(lit.token.kind);
}

[[nodiscard]] std::string op_text(const Token & op) { return fmt::format("'{}'", op.literal); }

[[nodiscard]] std::string_view op_name(TokenKind k)
{
  return syntax::is_valid(k) ? syntax::name(k) : std::string_view("<invalid>");
}

}  // namespace

std::optional<FilterError> Analyzer::analyze(const Expr * expr)
{
  err_.reset();
  walk(*this, expr);
  return err_;
}

ExprVisitor * Analyzer::visit(const Expr * node)
{
  if (err_) {
    return nullptr;
  }
  if (node == nullptr) {
    fail(ErrorTag::NilExpression, "expression cannot be null", k_no_position);
    return nullptr;
  }

  switch (node->get_kind()) {
    case NodeKind::Ident:
      check_ident(cast<Ident>(node));
      break;
    case NodeKind::Literal:
      check_literal(cast<Literal>(node));
      break;
    case NodeKind::ListLiteral:
      check_list(cast<ListLiteral>(node));
      break;
    case NodeKind::UnaryExpr:
      check_unary(cast<UnaryExpr>(node));
      break;
    case NodeKind::BinaryExpr:
      check_binary(cast<BinaryExpr>(node));
      break;
    case NodeKind::IndexExpr:
      check_index(cast<IndexExpr>(node));
      break;
    case NodeKind::ParenExpr:
      check_paren(cast<ParenExpr>(node));
      break;
  }

  return err_ ? nullptr : this;
}

void Analyzer::fail(ErrorTag tag, std::string detail, Position pos)
{
  if (!err_) {
    err_ = FilterError(tag, std::move(detail), pos);
  }
}

// ============================================================================
// Atomic nodes
// ============================================================================

void Analyzer::check_ident(const Ident * node)
{
  if (node->token.kind != TokenKind::Ident) {
    fail(
      ErrorTag::IdentTokenMismatch,
      fmt::format("identifier token must be IDENT, got {}", syntax::name(node->token.kind)),
      node->start());
    return;
  }
  if (!syntax::is_identifier(node->value)) {
    const std::string_view why = syntax::is_keyword(node->value)
                                   ? "is a reserved keyword"
                                   : "is not a valid identifier";
    fail(
      ErrorTag::InvalidIdentifier, fmt::format("'{}' {}", node->value, why), node->start());
  }
}

void Analyzer::check_literal(const Literal * node)
{
  switch (node->token.kind) {
    case TokenKind::String:
      return;
    case TokenKind::Number:
      if (!node->as_number()) {
        fail(
          ErrorTag::InvalidNumberLiteral,
          fmt::format("'{}' is not a valid number", node->value), node->start());
      }
      return;
    case TokenKind::True:
    case TokenKind::False:
      if (!node->as_bool()) {
        fail(
          ErrorTag::InvalidBooleanLiteral,
          fmt::format(
            "'{}' does not match boolean token {}", node->value, syntax::name(node->token.kind)),
          node->start());
      }
      return;
    default:
      fail(
        ErrorTag::UnsupportedLiteralKind,
        fmt::format("unsupported literal type {}", syntax::name(node->token.kind)),
        node->start());
      return;
  }
}

void Analyzer::check_list(const ListLiteral * node)
{
  if (node->values.empty()) {
    fail(ErrorTag::EmptyList, "list literal cannot be empty", node->start());
    return;
  }

  const Literal * first = node->values[0];
  for (size_t i = 0; i < node->values.size(); ++i) {
    const Literal * value = node->values[i];
    if (value == nullptr) {
      fail(
        ErrorTag::NilExpression, fmt::format("list element at index {} is null", i),
        node->start());
      return;
    }
    // Element kinds are validated before they are compared
    check_literal(value);
    if (err_) {
      return;
    }
    if (i > 0 && first != nullptr && !value->is_same_kind(*first)) {
      fail(
        ErrorTag::HeterogeneousList,
        fmt::format(
          "list element at index {} has type {}, but expected {} (all elements must have the "
          "same type)",
          i, scalar_class_name(*value), scalar_class_name(*first)),
        value->start());
      return;
    }
  }
}

// ============================================================================
// Computed nodes
// ============================================================================

void Analyzer::check_unary(const UnaryExpr * node)
{
  if (!syntax::is_valid(node->op.kind) || !syntax::is_unary_operator(node->op.kind)) {
    fail(
      ErrorTag::UnsupportedUnaryOperator,
      fmt::format("unsupported unary operator {}", op_name(node->op.kind)), node->start());
    return;
  }
  if (node->right != nullptr && !is_computed(node->right)) {
    fail(
      ErrorTag::LogicalOperandNotComputed,
      fmt::format(
        "{} operator requires a computed operand, got {}", op_text(node->op),
        kind_name(node->right)),
      node->right->start());
  }
}

bool Analyzer::check_field_operand(const BinaryExpr * node)
{
  if (isa<Ident>(node->left) || isa<IndexExpr>(node->left)) {
    return true;
  }
  const Position pos = node->left != nullptr ? node->left->start() : node->op.start;
  fail(
    ErrorTag::ComparisonLeftShape,
    fmt::format(
      "{} operator requires an identifier or index expression on the left side, got {}",
      op_text(node->op), kind_name(node->left)),
    pos);
  return false;
}

void Analyzer::check_binary(const BinaryExpr * node)
{
  const TokenKind op = node->op.kind;
  if (!syntax::is_valid(op) || !syntax::is_binary_operator(op)) {
    fail(
      ErrorTag::UnsupportedBinaryOperator,
      fmt::format("unsupported binary operator {}", op_name(op)),
      node->op.start);
    return;
  }

  // Null operands are reported by the walk as NilExpression
  if (syntax::is_logical_operator(op)) {
    for (const Expr * operand : {node->left, node->right}) {
      if (operand != nullptr && !is_computed(operand)) {
        fail(
          ErrorTag::LogicalOperandNotComputed,
          fmt::format(
            "{} operator requires computed operands, got {}", op_text(node->op),
            kind_name(operand)),
          operand->start());
        return;
      }
    }
    return;
  }

  if (node->left != nullptr && !check_field_operand(node)) {
    return;
  }
  if (node->right == nullptr) {
    return;
  }

  const Position rpos = node->right->start();
  if (syntax::is_equality_operator(op)) {
    if (!isa<Literal>(node->right)) {
      fail(
        ErrorTag::EqualityRightNotLiteral,
        fmt::format(
          "{} operator requires a literal value on the right side, got {}", op_text(node->op),
          kind_name(node->right)),
        rpos);
    }
    return;
  }

  if (syntax::is_ordering_operator(op)) {
    const auto * lit = dyn_cast<Literal>(node->right);
    if (lit == nullptr || !lit->is_number()) {
      fail(
        ErrorTag::OrderingRightNotNumeric,
        fmt::format(
          "{} operator requires a numeric literal on the right side, got {}", op_text(node->op),
          lit != nullptr ? scalar_class_name(*lit) : kind_name(node->right)),
        rpos);
    }
    return;
  }

  if (op == TokenKind::In) {
    if (!isa<ListLiteral>(node->right)) {
      fail(
        ErrorTag::InRightNotList,
        fmt::format(
          "'in' operator requires a list literal on the right side, got {}",
          kind_name(node->right)),
        rpos);
    }
    return;
  }

  // op == TokenKind::Like
  const auto * lit = dyn_cast<Literal>(node->right);
  if (lit == nullptr || !lit->is_string()) {
    fail(
      ErrorTag::LikeRightNotString,
      fmt::format(
        "'like' operator requires a string literal on the right side, got {}",
        lit != nullptr ? scalar_class_name(*lit) : kind_name(node->right)),
      rpos);
  }
}

void Analyzer::check_index(const IndexExpr * node)
{
  if (node->left != nullptr && !isa<Ident>(node->left) && !isa<IndexExpr>(node->left)) {
    fail(
      ErrorTag::IndexLeftShape,
      fmt::format(
        "index expression requires an identifier or another index expression on the left "
        "side, got {}",
        kind_name(node->left)),
      node->left->start());
    return;
  }
  if (node->index == nullptr) {
    fail(ErrorTag::NilExpression, "index expression has no index", node->lbrack.start);
    return;
  }
  if (!node->index->is_number() && !node->index->is_string()) {
    fail(
      ErrorTag::IndexNotScalar,
      fmt::format(
        "index must be a number or string literal, got {}",
        syntax::name(node->index->token.kind)),
      node->index->start());
  }
}

void Analyzer::check_paren(const ParenExpr * node)
{
  if (node->inner != nullptr && !is_computed(node->inner)) {
    fail(
      ErrorTag::ParenOperandNotComputed,
      fmt::format("parentheses must wrap a computed expression, got {}", kind_name(node->inner)),
      node->inner->start());
  }
}

std::optional<FilterError> analyze(const Expr * expr)
{
  Analyzer analyzer;
  return analyzer.analyze(expr);
}

}  // namespace vfilter
