// vfilter/ast/builder.hpp - Programmatic construction of filter trees
//
// ExprBuilder is the single place where synthetic tokens are made, so the
// parser and user code get the same literal normalization.
//
// Example:
//   AstContext ctx;
//   ExprBuilder b(ctx);
//   auto * e = b.and_(b.gt("age", 18), b.in("status", {"active", "pending"}));
//
#pragma once

#include <fmt/core.h>

#include <initializer_list>
#include <string_view>
#include <type_traits>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"

namespace vfilter
{

namespace detail
{

template <typename T>
inline constexpr bool is_expr_pointer_v =
  std::is_pointer_v<T> && std::is_base_of_v<Expr, std::remove_cv_t<std::remove_pointer_t<T>>>;

template <typename T>
inline constexpr bool is_string_like_v =
  std::is_convertible_v<const T &, std::string_view> && !std::is_pointer_v<T>;

template <typename T>
inline constexpr bool is_c_string_v =
  std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>;

template <typename T>
inline constexpr bool is_numeric_v =
  std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>;

}  // namespace detail

class ExprBuilder
{
public:
  explicit ExprBuilder(AstContext & ctx) : ctx_(ctx) {}

  [[nodiscard]] AstContext & context() noexcept { return ctx_; }

  // ===========================================================================
  // Atomic nodes
  // ===========================================================================

  Ident * ident(std::string_view name);
  Ident * ident(Ident * id) noexcept { return id; }

  Literal * literal(Literal * lit) noexcept { return lit; }
  Literal * literal(bool value);
  Literal * literal(std::string_view value);
  Literal * literal(const char * value) { return literal(std::string_view(value)); }

  /// Integers and floats are formatted and then normalized.
  template <typename T, std::enable_if_t<detail::is_numeric_v<T>, int> = 0>
  Literal * literal(T value)
  {
    return number_literal(fmt::format("{}", value));
  }

  /// Literal from number text, e.g. "1.23e+02" becomes "123".
  Literal * number_literal(std::string_view text);

  ListLiteral * list(ListLiteral * l) noexcept { return l; }
  ListLiteral * list(const std::vector<Literal *> & values);

  template <typename T>
  ListLiteral * list(const std::vector<T> & values)
  {
    std::vector<Literal *> lits;
    lits.reserve(values.size());
    for (const auto & v : values) {
      lits.push_back(to_literal(v));
    }
    return list(lits);
  }

  template <typename T>
  ListLiteral * list(std::initializer_list<T> values)
  {
    return list(std::vector<T>(values));
  }

  // ===========================================================================
  // Comparison and membership
  // ===========================================================================

  template <typename F, typename V>
  BinaryExpr * eq(const F & field, const V & value)
  {
    return binary(TokenKind::Eq, to_field(field), to_value(value));
  }

  template <typename F, typename V>
  BinaryExpr * ne(const F & field, const V & value)
  {
    return binary(TokenKind::Ne, to_field(field), to_value(value));
  }

  template <typename F, typename V>
  BinaryExpr * lt(const F & field, const V & value)
  {
    return binary(TokenKind::Lt, to_field(field), to_ordering_value(value));
  }

  template <typename F, typename V>
  BinaryExpr * le(const F & field, const V & value)
  {
    return binary(TokenKind::Le, to_field(field), to_ordering_value(value));
  }

  template <typename F, typename V>
  BinaryExpr * gt(const F & field, const V & value)
  {
    return binary(TokenKind::Gt, to_field(field), to_ordering_value(value));
  }

  template <typename F, typename V>
  BinaryExpr * ge(const F & field, const V & value)
  {
    return binary(TokenKind::Ge, to_field(field), to_ordering_value(value));
  }

  /// `field in (values...)`; `values` is a vector, a ListLiteral or any Expr.
  template <typename F, typename V>
  BinaryExpr * in(const F & field, const V & values)
  {
    if constexpr (detail::is_expr_pointer_v<V>) {
      return binary(TokenKind::In, to_field(field), values);
    } else {
      return binary(TokenKind::In, to_field(field), list(values));
    }
  }

  template <typename F, typename T>
  BinaryExpr * in(const F & field, std::initializer_list<T> values)
  {
    return binary(TokenKind::In, to_field(field), list(values));
  }

  template <typename F>
  BinaryExpr * like(const F & field, std::string_view pattern)
  {
    return binary(TokenKind::Like, to_field(field), literal(pattern));
  }

  template <typename F>
  BinaryExpr * like(const F & field, Literal * pattern)
  {
    return binary(TokenKind::Like, to_field(field), pattern);
  }

  // ===========================================================================
  // Logical and structural nodes
  // ===========================================================================

  BinaryExpr * and_(Expr * a, Expr * b) { return binary(TokenKind::And, a, b); }
  BinaryExpr * or_(Expr * a, Expr * b) { return binary(TokenKind::Or, a, b); }
  UnaryExpr * not_(Expr * operand) { return unary(TokenKind::Not, operand); }

  /// `base[key]`; nesting index() builds the chain `base.k1.k2`.
  template <typename B, typename K>
  IndexExpr * index(const B & base, const K & key)
  {
    return make_index(to_field(base), to_literal(key));
  }

  ParenExpr * paren(Expr * inner);

  /// Raw nodes for any operator kind; no shape checks.
  BinaryExpr * binary(TokenKind op, Expr * left, Expr * right);
  UnaryExpr * unary(TokenKind op, Expr * operand);

private:
  IndexExpr * make_index(Expr * base, Literal * key);

  template <typename T>
  Literal * to_literal(const T & v)
  {
    if constexpr (detail::is_expr_pointer_v<T>) {
      static_assert(
        std::is_base_of_v<Literal, std::remove_cv_t<std::remove_pointer_t<T>>>,
        "list elements and index keys must be literals");
      return const_cast<Literal *>(v);
    } else if constexpr (detail::is_c_string_v<T> || detail::is_string_like_v<T>) {
      return literal(std::string_view(v));
    } else {
      static_assert(std::is_arithmetic_v<T>, "unsupported literal type");
      return literal(v);
    }
  }

  template <typename F>
  Expr * to_field(const F & f)
  {
    if constexpr (detail::is_expr_pointer_v<F>) {
      return const_cast<Expr *>(static_cast<const Expr *>(f));
    } else {
      static_assert(
        detail::is_c_string_v<F> || detail::is_string_like_v<F>,
        "field must be a name or an expression");
      return ident(std::string_view(f));
    }
  }

  template <typename V>
  Expr * to_value(const V & v)
  {
    if constexpr (detail::is_expr_pointer_v<V>) {
      return const_cast<Expr *>(static_cast<const Expr *>(v));
    } else {
      return to_literal(v);
    }
  }

  template <typename V>
  Expr * to_ordering_value(const V & v)
  {
    static_assert(
      detail::is_expr_pointer_v<V> || detail::is_numeric_v<V>,
      "ordering operators compare against numbers");
    return to_value(v);
  }

  AstContext & ctx_;
};

}  // namespace vfilter
