// vfilter/sema/analyzer.hpp - Semantic validation of filter trees
//
// The analyzer is a walk() visitor. It checks operand shapes, operator
// applicability and list homogeneity, latches the first error and stops
// descending once one is found. It never mutates the tree.
//
#pragma once

#include <optional>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/visitor.hpp"
#include "vfilter/basic/filter_error.hpp"

namespace vfilter
{

/**
 * Single-use semantic analyzer.
 *
 * ## Rules
 * - Ident: IDENT token and a valid identifier
 * - Literal: STRING, parseable NUMBER, or consistent TRUE/FALSE
 * - ListLiteral: non-empty, one scalar class throughout
 * - UnaryExpr: `not` over a computed operand
 * - BinaryExpr: logical operands computed; comparisons have an Ident or
 *   IndexExpr on the left and the operator's literal shape on the right
 * - IndexExpr: Ident/IndexExpr base, NUMBER or STRING key
 * - ParenExpr: computed inner expression
 *
 * ## Usage
 * ```cpp
 * Analyzer analyzer;
 * if (auto err = analyzer.analyze(expr)) {
 *   std::cerr << err->message() << "\n";
 * }
 * ```
 */
class Analyzer : public ExprVisitor
{
public:
  Analyzer() = default;

  /// Walk `expr` and return the first error, if any.
  [[nodiscard]] std::optional<FilterError> analyze(const Expr * expr);

  ExprVisitor * visit(const Expr * node) override;

  [[nodiscard]] const std::optional<FilterError> & error() const noexcept { return err_; }

private:
  void check_ident(const Ident * node);
  void check_literal(const Literal * node);
  void check_list(const ListLiteral * node);
  void check_unary(const UnaryExpr * node);
  void check_binary(const BinaryExpr * node);
  void check_index(const IndexExpr * node);
  void check_paren(const ParenExpr * node);

  /// Left operand of a comparison must name a field.
  bool check_field_operand(const BinaryExpr * node);

  void fail(ErrorTag tag, std::string detail, Position pos);

  std::optional<FilterError> err_;
};

/// Convenience wrapper around a fresh Analyzer.
[[nodiscard]] std::optional<FilterError> analyze(const Expr * expr);

}  // namespace vfilter
