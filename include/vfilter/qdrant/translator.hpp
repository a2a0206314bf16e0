// vfilter/qdrant/translator.hpp - Lowering of filter trees to backend filters
//
// Logical structure maps onto clause groups:
//  - `a and b and c`  -> must [a, b, c]
//  - `a or b`         -> should [a, b]
//  - `not x`          -> must_not [x]
// A change of logical operator opens a nested filter. Comparisons become
// field conditions keyed by the dotted path of their left operand.
//
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/visitor.hpp"
#include "vfilter/basic/filter_error.hpp"
#include "vfilter/qdrant/filter.hpp"

namespace vfilter::qdrant
{

/// Value of one literal after coercion.
using ScalarValue = std::variant<std::string, double, bool>;

/// Contents of the value slot: nothing, a scalar, or a list of scalars.
using FieldValue = std::variant<std::monostate, std::string, double, bool, std::vector<ScalarValue>>;

struct TranslateResult
{
  Filter filter;
  std::optional<FilterError> error;  ///< When set, `filter` is partial and must not be used

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/**
 * Single-use translator from AST to Filter.
 *
 * The translator keeps two slots, the current field key and the current
 * field value. Atomic nodes write to them; comparisons read them through
 * extract_field_key() / extract_field_value(), which always restore the
 * previous slot contents.
 */
class Translator : public ExprVisitor
{
public:
  Translator() = default;

  /// Translate `expr` into a fresh root filter; returns the latched error.
  std::optional<FilterError> translate(const Expr * expr);

  /// Translates `node` into the root filter. Never descends further.
  ExprVisitor * visit(const Expr * node) override;

  [[nodiscard]] const Filter & filter() const noexcept { return root_; }
  [[nodiscard]] Filter take_filter() { return std::move(root_); }
  [[nodiscard]] const std::optional<FilterError> & error() const noexcept { return err_; }

  [[nodiscard]] const std::string & current_field_key() const noexcept { return current_key_; }
  [[nodiscard]] const FieldValue & current_field_value() const noexcept { return current_value_; }

  /// Dotted field path of an Ident or IndexExpr. Slots are left untouched.
  std::optional<std::string> extract_field_key(const Expr * node);

  /// Coerced value of a Literal or ListLiteral. Slots are left untouched.
  std::optional<FieldValue> extract_field_value(const Expr * node);

private:
  bool translate_into(Filter & target, const Expr * node);
  bool translate_logical(Filter & target, const BinaryExpr * node);
  bool translate_not(Filter & target, const UnaryExpr * node);
  bool translate_comparison(Filter & target, const BinaryExpr * node);

  bool emit_equality(Filter & target, const BinaryExpr * node, std::string key, FieldValue value);
  bool emit_range(Filter & target, const BinaryExpr * node, std::string key, FieldValue value);
  bool emit_in(Filter & target, const BinaryExpr * node, std::string key, FieldValue value);
  bool emit_like(Filter & target, const BinaryExpr * node, std::string key, FieldValue value);

  /// Translate `node` on its own and wrap the result as one condition.
  std::optional<Condition> build_condition(const Expr * node);

  std::optional<std::string> build_indexed_field_key(const IndexExpr * node);
  std::optional<ScalarValue> coerce_literal(const Literal * node);
  std::optional<int64_t> to_integer(double value, Position pos);

  bool fail(ErrorTag tag, std::string detail, Position pos);

  Filter root_;
  std::string current_key_;
  FieldValue current_value_;
  std::optional<FilterError> err_;
};

/// Translate with a fresh Translator.
[[nodiscard]] TranslateResult translate(const Expr * expr);

}  // namespace vfilter::qdrant
