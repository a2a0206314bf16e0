// vfilter/basic/filter_error.cpp
#include "vfilter/basic/filter_error.hpp"

#include <fmt/core.h>

#include <utility>

namespace vfilter
{

std::string_view to_string(ErrorTag tag) noexcept
{
  switch (tag) {
    case ErrorTag::NilExpression:
      return "NilExpression";
    case ErrorTag::UnsupportedExpression:
      return "UnsupportedExpression";
    case ErrorTag::IdentTokenMismatch:
      return "IdentTokenMismatch";
    case ErrorTag::InvalidIdentifier:
      return "InvalidIdentifier";
    case ErrorTag::UnsupportedLiteralKind:
      return "UnsupportedLiteralKind";
    case ErrorTag::InvalidNumberLiteral:
      return "InvalidNumberLiteral";
    case ErrorTag::InvalidBooleanLiteral:
      return "InvalidBooleanLiteral";
    case ErrorTag::EmptyList:
      return "EmptyList";
    case ErrorTag::HeterogeneousList:
      return "HeterogeneousList";
    case ErrorTag::EmptyInList:
      return "EmptyInList";
    case ErrorTag::ComparisonLeftShape:
      return "ComparisonLeftShape";
    case ErrorTag::IndexLeftShape:
      return "IndexLeftShape";
    case ErrorTag::IndexNotScalar:
      return "IndexNotScalar";
    case ErrorTag::LogicalOperandNotComputed:
      return "LogicalOperandNotComputed";
    case ErrorTag::ParenOperandNotComputed:
      return "ParenOperandNotComputed";
    case ErrorTag::UnsupportedUnaryOperator:
      return "UnsupportedUnaryOperator";
    case ErrorTag::UnsupportedBinaryOperator:
      return "UnsupportedBinaryOperator";
    case ErrorTag::EqualityRightNotLiteral:
      return "EqualityRightNotLiteral";
    case ErrorTag::OrderingRightNotNumeric:
      return "OrderingRightNotNumeric";
    case ErrorTag::InRightNotList:
      return "InRightNotList";
    case ErrorTag::LikeRightNotString:
      return "LikeRightNotString";
    case ErrorTag::NotANumber:
      return "NotANumber";
    case ErrorTag::SyntaxError:
      return "SyntaxError";
  }
  return "UnknownError";
}

FilterError::FilterError(ErrorTag t, std::string d, Position pos)
: tag(t), detail(std::move(d)), position(pos)
{
}

std::string FilterError::message() const
{
  if (!position.is_valid()) {
    return fmt::format("{}: {}", to_string(tag), detail);
  }
  return fmt::format("{}: {} at {}", to_string(tag), detail, position.to_string());
}

}  // namespace vfilter
