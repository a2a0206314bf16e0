// vfilter/qdrant/translator.cpp - AST to Qdrant filter lowering
#include "vfilter/qdrant/translator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

namespace vfilter::qdrant
{
namespace
{

// Closed-open bounds of the doubles that truncate into int64_t
constexpr double k_int64_lower = -9223372036854775808.0;
constexpr double k_int64_upper = 9223372036854775808.0;

[[nodiscard]] std::string_view kind_name(const Expr * e)
{
  return e == nullptr ? std::string_view("null") : vfilter::to_string(e->get_kind());
}

[[nodiscard]] std::string_view value_type_name(const FieldValue & v)
{
  switch (v.index()) {
    case 1:
      return "string";
    case 2:
      return "number";
    case 3:
      return "bool";
    case 4:
      return "list";
    default:
      return "nothing";
  }
}

[[nodiscard]] std::string op_text(const Token & op) { return fmt::format("'{}'", op.literal); }

[[nodiscard]] std::string_view op_name(TokenKind k)
{
  return syntax::is_valid(k) ? syntax::name(k) : std::string_view("<invalid>");
}

[[nodiscard]] Position pos_of(const Expr * e) { return e != nullptr ? e->start() : k_no_position; }

}  // namespace

// ============================================================================
// Driver
// ============================================================================

std::optional<FilterError> Translator::translate(const Expr * expr)
{
  root_ = Filter{};
  current_key_.clear();
  current_value_ = std::monostate{};
  err_.reset();
  walk(*this, expr);
  return err_;
}

ExprVisitor * Translator::visit(const Expr * node)
{
  if (!err_) {
    translate_into(root_, node);
  }
  return nullptr;
}

bool Translator::fail(ErrorTag tag, std::string detail, Position pos)
{
  if (!err_) {
    err_ = FilterError(tag, std::move(detail), pos);
  }
  return false;
}

bool Translator::translate_into(Filter & target, const Expr * node)
{
  if (err_) {
    return false;
  }
  if (node == nullptr) {
    return fail(ErrorTag::NilExpression, "cannot process null expression", k_no_position);
  }

  switch (node->get_kind()) {
    case NodeKind::Ident:
      current_key_ = std::string(cast<Ident>(node)->value);
      return true;
    case NodeKind::IndexExpr: {
      auto key = build_indexed_field_key(cast<IndexExpr>(node));
      if (!key) return false;
      current_key_ = std::move(*key);
      return true;
    }
    case NodeKind::Literal: {
      auto value = coerce_literal(cast<Literal>(node));
      if (!value) return false;
      std::visit([this](auto && v) { current_value_ = std::move(v); }, std::move(*value));
      return true;
    }
    case NodeKind::ListLiteral: {
      std::vector<ScalarValue> values;
      for (const Literal * lit : cast<ListLiteral>(node)->values) {
        if (lit == nullptr) {
          return fail(ErrorTag::NilExpression, "list element cannot be null", node->start());
        }
        auto value = coerce_literal(lit);
        if (!value) return false;
        values.push_back(std::move(*value));
      }
      current_value_ = std::move(values);
      return true;
    }
    case NodeKind::ParenExpr:
      return translate_into(target, cast<ParenExpr>(node)->inner);
    case NodeKind::UnaryExpr:
      return translate_not(target, cast<UnaryExpr>(node));
    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(node);
      if (syntax::is_valid(bin->op.kind) && syntax::is_logical_operator(bin->op.kind)) {
        return translate_logical(target, bin);
      }
      return translate_comparison(target, bin);
    }
  }
  return fail(
    ErrorTag::UnsupportedExpression,
    fmt::format("unsupported expression type {}", kind_name(node)), node->start());
}

// ============================================================================
// Logical composition
// ============================================================================

bool Translator::translate_logical(Filter & target, const BinaryExpr * node)
{
  std::vector<Condition> & group = (node->op.kind == TokenKind::And) ? target.must : target.should;

  for (const Expr * operand : {node->left, node->right}) {
    const Expr * inner = strip_parens(operand);
    const auto * same_op = dyn_cast<BinaryExpr>(inner);
    if (same_op != nullptr && same_op->op.kind == node->op.kind) {
      // Same operator: flatten into this filter's group
      if (!translate_logical(target, same_op)) return false;
      continue;
    }
    auto condition = build_condition(operand);
    if (!condition) return false;
    group.push_back(std::move(*condition));
  }
  return true;
}

bool Translator::translate_not(Filter & target, const UnaryExpr * node)
{
  if (!syntax::is_valid(node->op.kind) || !syntax::is_unary_operator(node->op.kind)) {
    return fail(
      ErrorTag::UnsupportedUnaryOperator,
      fmt::format("unsupported unary operator {}", op_name(node->op.kind)), node->start());
  }
  auto condition = build_condition(node->right);
  if (!condition) return false;
  target.must_not.push_back(std::move(*condition));
  return true;
}

std::optional<Condition> Translator::build_condition(const Expr * node)
{
  const Expr * inner = strip_parens(node);
  if (inner == nullptr) {
    fail(ErrorTag::NilExpression, "cannot build a condition from a null expression", pos_of(node));
    return std::nullopt;
  }
  if (!isa<BinaryExpr>(inner) && !isa<UnaryExpr>(inner)) {
    fail(
      ErrorTag::LogicalOperandNotComputed,
      fmt::format("cannot build a condition from {}", kind_name(inner)), inner->start());
    return std::nullopt;
  }

  Filter sub;
  if (!translate_into(sub, inner)) {
    return std::nullopt;
  }

  const auto * bin = dyn_cast<BinaryExpr>(inner);
  const bool is_comparison = bin != nullptr && !syntax::is_logical_operator(bin->op.kind);
  if (is_comparison && sub.must.size() == 1 && sub.should.empty() && sub.must_not.empty()) {
    return std::move(sub.must.front());
  }
  return Condition::make_nested(std::move(sub));
}

// ============================================================================
// Slots
// ============================================================================

std::optional<std::string> Translator::extract_field_key(const Expr * node)
{
  std::string saved_key = current_key_;
  FieldValue saved_value = current_value_;
  current_key_.clear();

  bool ok = false;
  if (node == nullptr) {
    fail(ErrorTag::NilExpression, "field expression cannot be null", k_no_position);
  } else if (!isa<Ident>(node) && !isa<IndexExpr>(node)) {
    fail(
      ErrorTag::ComparisonLeftShape,
      fmt::format("expected an identifier or index expression as field, got {}", kind_name(node)),
      node->start());
  } else {
    Filter scratch;
    ok = translate_into(scratch, node);
  }

  std::string key = std::move(current_key_);
  current_key_ = std::move(saved_key);
  current_value_ = std::move(saved_value);

  if (!ok) {
    return std::nullopt;
  }
  if (key.empty()) {
    fail(ErrorTag::ComparisonLeftShape, "failed to extract field key", node->start());
    return std::nullopt;
  }
  return key;
}

std::optional<FieldValue> Translator::extract_field_value(const Expr * node)
{
  std::string saved_key = current_key_;
  FieldValue saved_value = current_value_;
  current_value_ = std::monostate{};

  bool ok = false;
  if (node == nullptr) {
    fail(ErrorTag::NilExpression, "value expression cannot be null", k_no_position);
  } else if (!isa<Literal>(node) && !isa<ListLiteral>(node)) {
    fail(
      ErrorTag::UnsupportedExpression,
      fmt::format("expected a literal or list literal as value, got {}", kind_name(node)),
      node->start());
  } else {
    Filter scratch;
    ok = translate_into(scratch, node);
  }

  FieldValue value = std::move(current_value_);
  current_key_ = std::move(saved_key);
  current_value_ = std::move(saved_value);

  if (!ok) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> Translator::build_indexed_field_key(const IndexExpr * node)
{
  std::vector<std::string> parts;
  const Expr * cur = node;
  while (const auto * idx = dyn_cast<IndexExpr>(cur)) {
    const Literal * index = idx->index;
    if (index == nullptr) {
      fail(ErrorTag::NilExpression, "index expression has no index", idx->lbrack.start);
      return std::nullopt;
    }
    if (index->is_string()) {
      parts.emplace_back(index->value);
    } else if (index->is_number()) {
      const auto n = index->as_number();
      if (!n) {
        fail(
          ErrorTag::InvalidNumberLiteral, fmt::format("'{}' is not a valid number", index->value),
          index->start());
        return std::nullopt;
      }
      parts.push_back(syntax::format_number(*n));
    } else {
      fail(
        ErrorTag::IndexNotScalar,
        fmt::format(
          "index must be a number or string literal, got {}", syntax::name(index->token.kind)),
        index->start());
      return std::nullopt;
    }
    cur = idx->left;
  }

  const auto * base = dyn_cast<Ident>(cur);
  if (base == nullptr) {
    fail(
      ErrorTag::IndexLeftShape,
      fmt::format("index chain must start at an identifier, got {}", kind_name(cur)),
      pos_of(cur));
    return std::nullopt;
  }
  parts.emplace_back(base->value);

  std::string key;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!key.empty()) key += '.';
    key += *it;
  }
  return key;
}

std::optional<ScalarValue> Translator::coerce_literal(const Literal * node)
{
  switch (node->token.kind) {
    case TokenKind::String:
      return ScalarValue(std::string(node->value));
    case TokenKind::Number: {
      const auto n = node->as_number();
      if (!n) {
        fail(
          ErrorTag::InvalidNumberLiteral, fmt::format("'{}' is not a valid number", node->value),
          node->start());
        return std::nullopt;
      }
      return ScalarValue(*n);
    }
    case TokenKind::True:
    case TokenKind::False: {
      const auto b = node->as_bool();
      if (!b) {
        fail(
          ErrorTag::InvalidBooleanLiteral,
          fmt::format("'{}' is not a valid boolean", node->value), node->start());
        return std::nullopt;
      }
      return ScalarValue(*b);
    }
    default:
      fail(
        ErrorTag::UnsupportedLiteralKind,
        fmt::format("unsupported literal type {}", syntax::name(node->token.kind)),
        node->start());
      return std::nullopt;
  }
}

std::optional<int64_t> Translator::to_integer(double value, Position pos)
{
  if (!std::isfinite(value) || value < k_int64_lower || value >= k_int64_upper) {
    fail(
      ErrorTag::NotANumber,
      fmt::format("{} cannot be represented as a 64-bit integer", syntax::format_number(value)),
      pos);
    return std::nullopt;
  }
  return static_cast<int64_t>(std::trunc(value));
}

// ============================================================================
// Field conditions
// ============================================================================

bool Translator::translate_comparison(Filter & target, const BinaryExpr * node)
{
  const TokenKind op = node->op.kind;
  if (!syntax::is_valid(op) || !syntax::is_binary_operator(op)) {
    return fail(
      ErrorTag::UnsupportedBinaryOperator,
      fmt::format("unsupported binary operator {}", op_name(op)),
      node->op.start);
  }

  auto key = extract_field_key(node->left);
  if (!key) {
    return false;
  }

  // Right-hand shape checks mirror the analyzer so unanalyzed trees fail cleanly
  const Expr * right = node->right;
  if (syntax::is_equality_operator(op) && right != nullptr && !isa<Literal>(right)) {
    return fail(
      ErrorTag::EqualityRightNotLiteral,
      fmt::format("{} operator requires a literal value, got {}", op_text(node->op), kind_name(right)),
      right->start());
  }
  if (syntax::is_ordering_operator(op) && right != nullptr && !isa<Literal>(right)) {
    return fail(
      ErrorTag::OrderingRightNotNumeric,
      fmt::format("{} operator requires a numeric literal, got {}", op_text(node->op), kind_name(right)),
      right->start());
  }
  if (op == TokenKind::In && right != nullptr && !isa<ListLiteral>(right)) {
    return fail(
      ErrorTag::InRightNotList,
      fmt::format("'in' operator requires a list literal, got {}", kind_name(right)),
      right->start());
  }
  if (op == TokenKind::Like && right != nullptr && !isa<Literal>(right)) {
    return fail(
      ErrorTag::LikeRightNotString,
      fmt::format("'like' operator requires a string literal, got {}", kind_name(right)),
      right->start());
  }

  auto value = extract_field_value(right);
  if (!value) {
    return false;
  }

  if (syntax::is_equality_operator(op)) {
    return emit_equality(target, node, std::move(*key), std::move(*value));
  }
  if (syntax::is_ordering_operator(op)) {
    return emit_range(target, node, std::move(*key), std::move(*value));
  }
  if (op == TokenKind::In) {
    return emit_in(target, node, std::move(*key), std::move(*value));
  }
  return emit_like(target, node, std::move(*key), std::move(*value));
}

bool Translator::emit_equality(
  Filter & target, const BinaryExpr * node, std::string key, FieldValue value)
{
  std::vector<Condition> & group =
    (node->op.kind == TokenKind::Eq) ? target.must : target.must_not;
  const Position pos = pos_of(node->right);

  if (const auto * s = std::get_if<std::string>(&value)) {
    group.push_back(Condition::make_field(std::move(key), MatchKeyword{*s}));
    return true;
  }
  if (const auto * n = std::get_if<double>(&value)) {
    const auto i = to_integer(*n, pos);
    if (!i) return false;
    group.push_back(Condition::make_field(std::move(key), MatchInteger{*i}));
    return true;
  }
  if (const auto * b = std::get_if<bool>(&value)) {
    group.push_back(Condition::make_field(std::move(key), MatchBool{*b}));
    return true;
  }
  return fail(
    ErrorTag::EqualityRightNotLiteral,
    fmt::format("{} operator cannot compare against a {}", op_text(node->op), value_type_name(value)),
    pos);
}

bool Translator::emit_range(
  Filter & target, const BinaryExpr * node, std::string key, FieldValue value)
{
  const auto * n = std::get_if<double>(&value);
  if (n == nullptr || !std::isfinite(*n)) {
    return fail(
      ErrorTag::NotANumber,
      fmt::format(
        "{} operator requires a finite number, got {}", op_text(node->op), value_type_name(value)),
      pos_of(node->right));
  }

  Range range;
  switch (node->op.kind) {
    case TokenKind::Lt:
      range.lt = *n;
      break;
    case TokenKind::Le:
      range.lte = *n;
      break;
    case TokenKind::Gt:
      range.gt = *n;
      break;
    default:
      range.gte = *n;
      break;
  }
  target.must.push_back(Condition::make_field(std::move(key), range));
  return true;
}

bool Translator::emit_in(
  Filter & target, const BinaryExpr * node, std::string key, FieldValue value)
{
  const Position pos = pos_of(node->right);
  const auto * list = std::get_if<std::vector<ScalarValue>>(&value);
  if (list == nullptr) {
    return fail(
      ErrorTag::InRightNotList,
      fmt::format("'in' operator requires a list, got {}", value_type_name(value)), pos);
  }
  if (list->empty()) {
    return fail(ErrorTag::EmptyInList, "'in' operator requires a non-empty list", pos);
  }

  const size_t kind = list->front().index();
  const bool uniform = std::all_of(
    list->begin(), list->end(), [kind](const ScalarValue & v) { return v.index() == kind; });
  if (!uniform) {
    return fail(ErrorTag::HeterogeneousList, "'in' list elements must share one type", pos);
  }

  if (std::holds_alternative<std::string>(list->front())) {
    MatchKeywords keywords;
    for (const auto & v : *list) {
      keywords.values.push_back(std::get<std::string>(v));
    }
    target.must.push_back(Condition::make_field(std::move(key), std::move(keywords)));
    return true;
  }

  if (std::holds_alternative<double>(list->front())) {
    MatchIntegers integers;
    for (const auto & v : *list) {
      const auto i = to_integer(std::get<double>(v), pos);
      if (!i) return false;
      integers.values.push_back(*i);
    }
    target.must.push_back(Condition::make_field(std::move(key), std::move(integers)));
    return true;
  }

  // Booleans: any-of as a disjunction of single matches
  Filter any_of;
  for (const auto & v : *list) {
    any_of.should.push_back(Condition::make_field(key, MatchBool{std::get<bool>(v)}));
  }
  target.must.push_back(Condition::make_nested(std::move(any_of)));
  return true;
}

bool Translator::emit_like(
  Filter & target, const BinaryExpr * node, std::string key, FieldValue value)
{
  const auto * pattern = std::get_if<std::string>(&value);
  if (pattern == nullptr) {
    return fail(
      ErrorTag::LikeRightNotString,
      fmt::format("'like' operator requires a string pattern, got {}", value_type_name(value)),
      pos_of(node->right));
  }
  target.must.push_back(Condition::make_field(std::move(key), MatchText{*pattern}));
  return true;
}

TranslateResult translate(const Expr * expr)
{
  Translator translator;
  auto err = translator.translate(expr);
  return TranslateResult{translator.take_filter(), std::move(err)};
}

}  // namespace vfilter::qdrant
