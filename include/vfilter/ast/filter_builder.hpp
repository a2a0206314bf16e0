// vfilter/ast/filter_builder.hpp - Chained construction of filter trees
//
// Each call joins one more condition to the tree built so far with AND.
// The scope calls fill a fresh builder and join its tree with AND, OR or
// AND NOT. The first problem is kept and returned by build(); once it is
// set every later call is a no-op.
//
// Example:
//   AstContext ctx;
//   const BuildResult r = FilterBuilder(ctx)
//                           .gt("age", 18)
//                           .in("status", {"active", "pending"})
//                           .or_scope([](FilterBuilder & b) { b.eq("vip", true); })
//                           .build();
//   // age > 18 and status in ('active','pending') or vip == true
//
#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/basic/filter_error.hpp"

namespace vfilter
{

struct BuildResult
{
  Expr * expr = nullptr;  ///< nullptr on error, or when nothing was added
  std::optional<FilterError> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

class FilterBuilder
{
public:
  using Scope = std::function<void(FilterBuilder &)>;

  explicit FilterBuilder(AstContext & ctx) : nodes_(ctx) {}

  template <typename F, typename V>
  FilterBuilder & eq(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.eq(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & ne(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.ne(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & lt(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.lt(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & le(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.le(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & gt(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.gt(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & ge(const F & field, const V & value)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.ge(field, value)));
    return *this;
  }

  template <typename F, typename V>
  FilterBuilder & in(const F & field, const V & values)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.in(field, values)));
    return *this;
  }

  template <typename F, typename T>
  FilterBuilder & in(const F & field, std::initializer_list<T> values)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.in(field, values)));
    return *this;
  }

  template <typename F, typename P>
  FilterBuilder & like(const F & field, const P & pattern)
  {
    if (!err_) join(TokenKind::And, checked(nodes_.like(field, pattern)));
    return *this;
  }

  /// Adds a bare `base[key]` term. `base` is a name, an Ident or an IndexExpr.
  template <typename B, typename K>
  FilterBuilder & index(const B & base, const K & key)
  {
    if (!err_) {
      IndexExpr * ix = nodes_.index(base, key);
      if (check_field(ix)) join(TokenKind::And, ix);
    }
    return *this;
  }

  /// An empty and/or scope adds nothing. An empty not scope is an error.
  FilterBuilder & and_scope(const Scope & fill) { return join_scope(TokenKind::And, fill); }
  FilterBuilder & or_scope(const Scope & fill) { return join_scope(TokenKind::Or, fill); }
  FilterBuilder & not_scope(const Scope & fill) { return join_scope(TokenKind::Not, fill); }

  [[nodiscard]] bool has_error() const noexcept { return err_.has_value(); }

  [[nodiscard]] BuildResult build() const;

private:
  Expr * checked(BinaryExpr * cond);
  bool check_field(const Expr * field);
  bool check_value(const Expr * value);
  bool check_literal(const Literal * lit);

  void join(TokenKind op, Expr * cond);
  FilterBuilder & join_scope(TokenKind op, const Scope & fill);
  void fail(ErrorTag tag, std::string detail);

  ExprBuilder nodes_;
  Expr * root_ = nullptr;
  std::optional<FilterError> err_;
};

}  // namespace vfilter
