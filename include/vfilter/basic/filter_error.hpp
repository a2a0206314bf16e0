// vfilter/basic/filter_error.hpp - Value-typed errors of the filter core
//
// The analyzer and the translator latch the first FilterError they meet.
// Tests compare errors by tag; users see message().
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "vfilter/basic/source_manager.hpp"

namespace vfilter
{

enum class ErrorTag : uint8_t {
  // Structural
  NilExpression,
  UnsupportedExpression,
  // Identifier
  IdentTokenMismatch,
  InvalidIdentifier,
  // Literal
  UnsupportedLiteralKind,
  InvalidNumberLiteral,
  InvalidBooleanLiteral,
  // List
  EmptyList,
  HeterogeneousList,
  EmptyInList,
  // Shape
  ComparisonLeftShape,
  IndexLeftShape,
  IndexNotScalar,
  LogicalOperandNotComputed,
  ParenOperandNotComputed,
  // Operator
  UnsupportedUnaryOperator,
  UnsupportedBinaryOperator,
  EqualityRightNotLiteral,
  OrderingRightNotNumeric,
  InRightNotList,
  LikeRightNotString,
  // Translation
  NotANumber,
  // Text front-end
  SyntaxError,
};

[[nodiscard]] std::string_view to_string(ErrorTag tag) noexcept;

struct FilterError
{
  ErrorTag tag = ErrorTag::UnsupportedExpression;
  std::string detail;
  Position position;

  FilterError() = default;
  FilterError(ErrorTag t, std::string d, Position pos = k_no_position);

  /// "<Tag>: <detail> at L:C"; the location suffix is omitted for k_no_position.
  [[nodiscard]] std::string message() const;
};

[[nodiscard]] inline bool operator==(const FilterError & a, const FilterError & b)
{
  return a.tag == b.tag && a.detail == b.detail && a.position == b.position;
}
[[nodiscard]] inline bool operator!=(const FilterError & a, const FilterError & b)
{
  return !(a == b);
}

}  // namespace vfilter
