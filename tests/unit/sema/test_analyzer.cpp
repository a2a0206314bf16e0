#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/ast/clone.hpp"
#include "vfilter/basic/filter_error.hpp"
#include "vfilter/sema/analyzer.hpp"
#include "vfilter/test_support/parse_helpers.hpp"

using namespace vfilter;
using vfilter::test_support::parse;

class SemaAnalyzerTest : public ::testing::Test
{
protected:
  /// Tag of the first error, or nullopt when the tree is accepted.
  static std::optional<ErrorTag> tag_of(const Expr * e)
  {
    const auto err = analyze(e);
    if (!err) return std::nullopt;
    return err->tag;
  }

  AstContext ctx;
  ExprBuilder b{ctx};
};

// ============================================================================
// Accepted trees
// ============================================================================

TEST_F(SemaAnalyzerTest, AcceptsWellFormedTrees)
{
  EXPECT_EQ(tag_of(b.eq("status", "active")), std::nullopt);
  EXPECT_EQ(tag_of(b.ne("deleted", true)), std::nullopt);
  EXPECT_EQ(tag_of(b.gt("age", 18)), std::nullopt);
  EXPECT_EQ(tag_of(b.in("status", {"active", "pending", "approved"})), std::nullopt);
  EXPECT_EQ(tag_of(b.in("flag", {true, false})), std::nullopt);
  EXPECT_EQ(tag_of(b.like("name", "John%")), std::nullopt);
  EXPECT_EQ(tag_of(b.not_(b.eq("deleted", true))), std::nullopt);
  EXPECT_EQ(tag_of(b.eq(b.index(b.index("user", "profile"), "name"), "Alice")), std::nullopt);
  EXPECT_EQ(tag_of(b.eq(b.index("tags", 0), "x")), std::nullopt);
  EXPECT_EQ(tag_of(b.eq("café", 1)), std::nullopt);
  EXPECT_EQ(tag_of(b.eq("名前_２", 1)), std::nullopt);
  EXPECT_EQ(
    tag_of(b.and_(b.gt("age", 18), b.paren(b.or_(b.eq("a", 1), b.eq("b", 2))))), std::nullopt);
}

TEST_F(SemaAnalyzerTest, AcceptsParsedText)
{
  for (const char * src :
       {"a == 1", "not (a == 1 or b == 2)", "user['x'][0] in ('a', 'b')", "score <= -2.5",
        "name like 'J%' and vip != false"}) {
    auto unit = parse(src);
    ASSERT_TRUE(unit.ok()) << src << ": " << unit.first_error();
    EXPECT_EQ(tag_of(unit.root), std::nullopt) << src;
  }
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(SemaAnalyzerTest, RejectsNull)
{
  EXPECT_EQ(tag_of(nullptr), ErrorTag::NilExpression);
  EXPECT_EQ(tag_of(b.and_(nullptr, b.eq("a", 1))), ErrorTag::NilExpression);
  EXPECT_EQ(tag_of(b.not_(nullptr)), ErrorTag::NilExpression);
}

TEST_F(SemaAnalyzerTest, RejectsBadIdentifiers)
{
  Ident * wrong_token = ctx.create<Ident>(syntax::make_token(TokenKind::String, "name"));
  EXPECT_EQ(tag_of(b.eq(wrong_token, 1)), ErrorTag::IdentTokenMismatch);

  EXPECT_EQ(tag_of(b.eq("and", 1)), ErrorTag::InvalidIdentifier);
  EXPECT_EQ(tag_of(b.eq("user-id", 1)), ErrorTag::InvalidIdentifier);
  EXPECT_EQ(tag_of(b.eq("", 1)), ErrorTag::InvalidIdentifier);

  // Combining marks and non-ASCII punctuation are not name characters
  EXPECT_EQ(tag_of(b.eq("a\u0301", 1)), ErrorTag::InvalidIdentifier);
  EXPECT_EQ(tag_of(b.eq("x\u037E", 1)), ErrorTag::InvalidIdentifier);
  EXPECT_EQ(tag_of(b.eq("x\u2E2E", 1)), ErrorTag::InvalidIdentifier);
  EXPECT_EQ(tag_of(b.eq("x\u00BD", 1)), ErrorTag::InvalidIdentifier);

  const auto err = analyze(b.eq("or", 1));
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->detail, "'or' is a reserved keyword");
}

TEST_F(SemaAnalyzerTest, RejectsBadLiterals)
{
  Literal * bad_number = ctx.create<Literal>(syntax::make_token(TokenKind::Number, "12abc"));
  EXPECT_EQ(tag_of(b.eq("a", bad_number)), ErrorTag::InvalidNumberLiteral);

  Literal * bad_bool = ctx.create<Literal>(syntax::make_token(TokenKind::True, "false"));
  EXPECT_EQ(tag_of(b.eq("a", bad_bool)), ErrorTag::InvalidBooleanLiteral);

  Literal * comma = ctx.create<Literal>(syntax::make_kind_token(TokenKind::Comma));
  EXPECT_EQ(tag_of(b.eq("a", comma)), ErrorTag::UnsupportedLiteralKind);

  // The builder turns unparseable number text into an ERROR literal
  EXPECT_EQ(tag_of(b.eq("a", b.number_literal("twelve"))), ErrorTag::UnsupportedLiteralKind);
}

TEST_F(SemaAnalyzerTest, RejectsBadLists)
{
  EXPECT_EQ(tag_of(b.in("status", std::vector<Literal *>{})), ErrorTag::EmptyList);

  const auto err = analyze(b.in("x", b.list(std::vector<Literal *>{b.literal(1), b.literal("a")})));
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->tag, ErrorTag::HeterogeneousList);
  EXPECT_EQ(
    err->detail,
    "list element at index 1 has type string, but expected number (all elements must have the "
    "same type)");

  EXPECT_EQ(
    tag_of(b.in("x", b.list(std::vector<Literal *>{b.literal(true), nullptr}))),
    ErrorTag::NilExpression);

  // Broken elements are reported as such, not as a type mismatch
  const auto bad = analyze(b.in(
    "x", b.list(std::vector<Literal *>{b.number_literal("one"), b.number_literal("two")})));
  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(bad->tag, ErrorTag::UnsupportedLiteralKind);
  EXPECT_EQ(bad->detail, "unsupported literal type ERROR");

  Literal * bad_number = ctx.create<Literal>(syntax::make_token(TokenKind::Number, "12abc"));
  EXPECT_EQ(
    tag_of(b.in("x", b.list(std::vector<Literal *>{b.literal(1), bad_number}))),
    ErrorTag::InvalidNumberLiteral);
}

TEST_F(SemaAnalyzerTest, RejectsOperandShapes)
{
  EXPECT_EQ(tag_of(b.eq(b.literal(5), 3)), ErrorTag::ComparisonLeftShape);
  EXPECT_EQ(tag_of(b.gt(b.paren(b.eq("a", 1)), 3)), ErrorTag::ComparisonLeftShape);
  EXPECT_EQ(tag_of(b.eq(b.index(b.literal("x"), "a"), 1)), ErrorTag::IndexLeftShape);
  EXPECT_EQ(tag_of(b.eq(b.index("a", b.literal(true)), 1)), ErrorTag::IndexNotScalar);
  EXPECT_EQ(tag_of(b.and_(b.ident("a"), b.eq("b", 1))), ErrorTag::LogicalOperandNotComputed);
  EXPECT_EQ(tag_of(b.or_(b.eq("b", 1), b.literal(true))), ErrorTag::LogicalOperandNotComputed);
  EXPECT_EQ(tag_of(b.not_(b.ident("a"))), ErrorTag::LogicalOperandNotComputed);
  EXPECT_EQ(tag_of(b.paren(b.ident("a"))), ErrorTag::ParenOperandNotComputed);
}

TEST_F(SemaAnalyzerTest, RejectsOperators)
{
  EXPECT_EQ(tag_of(b.unary(TokenKind::And, b.eq("a", 1))), ErrorTag::UnsupportedUnaryOperator);
  EXPECT_EQ(
    tag_of(b.binary(TokenKind::Comma, b.ident("a"), b.literal(1))),
    ErrorTag::UnsupportedBinaryOperator);
  EXPECT_EQ(
    tag_of(ctx.create<BinaryExpr>(
      b.ident("a"), syntax::make_token(static_cast<TokenKind>(200), "?"), b.literal(1))),
    ErrorTag::UnsupportedBinaryOperator);
}

TEST_F(SemaAnalyzerTest, RejectsRightOperands)
{
  EXPECT_EQ(tag_of(b.eq("a", b.ident("b"))), ErrorTag::EqualityRightNotLiteral);
  EXPECT_EQ(tag_of(b.ne("a", b.list({1, 2}))), ErrorTag::EqualityRightNotLiteral);
  EXPECT_EQ(tag_of(b.gt("age", b.literal("eighteen"))), ErrorTag::OrderingRightNotNumeric);
  EXPECT_EQ(tag_of(b.le("age", b.literal(true))), ErrorTag::OrderingRightNotNumeric);
  EXPECT_EQ(tag_of(b.in("status", b.literal("active"))), ErrorTag::InRightNotList);
  EXPECT_EQ(tag_of(b.like("name", b.literal(1))), ErrorTag::LikeRightNotString);
}

TEST_F(SemaAnalyzerTest, ReportsTheFirstErrorOnly)
{
  // Left operand fails before the right one is looked at
  const Expr * e = b.and_(b.eq(b.literal(5), 3), b.in("x", std::vector<Literal *>{}));
  EXPECT_EQ(tag_of(e), ErrorTag::ComparisonLeftShape);

  Analyzer analyzer;
  ASSERT_TRUE(analyzer.analyze(e).has_value());
  EXPECT_EQ(analyzer.error()->tag, ErrorTag::ComparisonLeftShape);
}

TEST_F(SemaAnalyzerTest, ErrorsCarryPositions)
{
  auto unit = parse("a == 1 and age > 'x'");
  ASSERT_TRUE(unit.ok()) << unit.first_error();

  const auto err = analyze(unit.root);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->tag, ErrorTag::OrderingRightNotNumeric);
  EXPECT_EQ(err->position, (Position{1, 18}));
  EXPECT_EQ(
    err->message(),
    "OrderingRightNotNumeric: '>' operator requires a numeric literal on the right side, got "
    "string at 1:18");
}

TEST_F(SemaAnalyzerTest, AnalysisDoesNotChangeTheTree)
{
  const Expr * e = b.or_(b.eq("a", 1), b.in("b", {"x", "y"}));
  AstContext other;
  ExprBuilder ob(other);
  const Expr * twin = ob.or_(ob.eq("a", 1), ob.in("b", {"x", "y"}));

  EXPECT_FALSE(analyze(e).has_value());
  EXPECT_FALSE(analyze(e).has_value());
  EXPECT_TRUE(equals(e, twin));
}
