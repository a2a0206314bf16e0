#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/ast/clone.hpp"
#include "vfilter/ast/filter_builder.hpp"
#include "vfilter/ast/sql_printer.hpp"
#include "vfilter/sema/analyzer.hpp"

using namespace vfilter;

class AstFilterBuilderTest : public ::testing::Test
{
protected:
  std::string sql_of(const FilterBuilder & fb)
  {
    const BuildResult r = fb.build();
    EXPECT_TRUE(r.ok()) << r.error->message();
    return to_sql(r.expr);
  }

  AstContext ctx;
  ExprBuilder b{ctx};
};

// ============================================================================
// Chaining
// ============================================================================

TEST_F(AstFilterBuilderTest, ConditionsJoinWithAnd)
{
  FilterBuilder fb(ctx);
  fb.eq("status", "active").gt("age", 18).in("tags", {"a", "b"}).like("name", "J%");

  EXPECT_EQ(
    sql_of(fb), "status == 'active' and age > 18 and tags in ('a','b') and name like 'J%'");

  // Left-deep, same as writing the and_ calls by hand
  const Expr * expected = b.and_(
    b.and_(b.and_(b.eq("status", "active"), b.gt("age", 18)), b.in("tags", {"a", "b"})),
    b.like("name", "J%"));
  EXPECT_TRUE(equals(fb.build().expr, expected));
  EXPECT_EQ(analyze(fb.build().expr), std::nullopt);
}

TEST_F(AstFilterBuilderTest, EveryComparisonOperator)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).ne("b", false).lt("c", 2).le("d", 3.5).gt("e", -1).ge("f", 0);
  EXPECT_EQ(sql_of(fb), "a == 1 and b != false and c < 2 and d <= 3.5 and e > -1 and f >= 0");
}

TEST_F(AstFilterBuilderTest, SingleConditionIsTheRoot)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1);
  const BuildResult r = fb.build();
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(isa<BinaryExpr>(r.expr));
  EXPECT_EQ(to_sql(r.expr), "a == 1");
}

TEST_F(AstFilterBuilderTest, EmptyBuilderYieldsNoTree)
{
  const BuildResult r = FilterBuilder(ctx).build();
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.expr, nullptr);
}

TEST_F(AstFilterBuilderTest, FieldsMayBeIndexChains)
{
  FilterBuilder fb(ctx);
  fb.eq(b.index(b.index("user", "profile"), "name"), "Alice").in(b.index("tags", 0), {"x"});
  EXPECT_EQ(sql_of(fb), "user['profile']['name'] == 'Alice' and tags[0] in ('x')");
}

TEST_F(AstFilterBuilderTest, BareIndexTerm)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).index(b.index("m", "k"), 2);
  EXPECT_EQ(sql_of(fb), "a == 1 and m['k'][2]");
}

// ============================================================================
// Scopes
// ============================================================================

TEST_F(AstFilterBuilderTest, OrScopeJoinsWithOr)
{
  FilterBuilder fb(ctx);
  fb.gt("age", 18).in("status", {"active", "pending"}).or_scope([](FilterBuilder & s) {
    s.eq("vip", true);
  });
  EXPECT_EQ(sql_of(fb), "age > 18 and status in ('active','pending') or vip == true");
}

TEST_F(AstFilterBuilderTest, AndScopeKeepsItsGroup)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).and_scope([](FilterBuilder & s) {
    s.eq("b", 2).or_scope([](FilterBuilder & t) { t.eq("c", 3); });
  });
  EXPECT_EQ(sql_of(fb), "a == 1 and (b == 2 or c == 3)");
}

TEST_F(AstFilterBuilderTest, NotScopeNegatesItsGroup)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).not_scope([](FilterBuilder & s) { s.eq("deleted", true).eq("archived", true); });
  EXPECT_EQ(sql_of(fb), "a == 1 and not (deleted == true and archived == true)");

  FilterBuilder first(ctx);
  first.not_scope([](FilterBuilder & s) { s.eq("x", 1); });
  EXPECT_EQ(sql_of(first), "not (x == 1)");
}

TEST_F(AstFilterBuilderTest, EmptyAndOrScopesAddNothing)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).and_scope([](FilterBuilder &) {}).or_scope([](FilterBuilder &) {});
  EXPECT_EQ(sql_of(fb), "a == 1");
}

// ============================================================================
// Deferred errors
// ============================================================================

TEST_F(AstFilterBuilderTest, EmptyNotScopeIsAnError)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).not_scope([](FilterBuilder &) {});
  const BuildResult r = fb.build();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.expr, nullptr);
  EXPECT_EQ(r.error->tag, ErrorTag::NilExpression);
  EXPECT_EQ(r.error->message(), "NilExpression: not scope added no conditions");
}

TEST_F(AstFilterBuilderTest, UnconvertibleNumberIsReportedAtBuild)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).gt("score", std::numeric_limits<double>::quiet_NaN()).eq("b", 2);
  EXPECT_TRUE(fb.has_error());

  const BuildResult r = fb.build();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.expr, nullptr);
  EXPECT_EQ(r.error->tag, ErrorTag::UnsupportedLiteralKind);
  EXPECT_EQ(r.error->detail, "invalid number literal 'nan'");
}

TEST_F(AstFilterBuilderTest, BadListElementIsReported)
{
  FilterBuilder fb(ctx);
  fb.in("x", std::vector<double>{1.0, std::numeric_limits<double>::infinity()});
  ASSERT_TRUE(fb.has_error());
  EXPECT_EQ(fb.build().error->tag, ErrorTag::UnsupportedLiteralKind);
}

TEST_F(AstFilterBuilderTest, NullOperandsAreReported)
{
  FilterBuilder null_field(ctx);
  null_field.eq(static_cast<Expr *>(nullptr), 1);
  EXPECT_EQ(null_field.build().error->detail, "field is null");

  FilterBuilder null_value(ctx);
  null_value.eq("a", static_cast<Literal *>(nullptr));
  EXPECT_EQ(null_value.build().error->message(), "NilExpression: value of '==' is null");
}

TEST_F(AstFilterBuilderTest, FieldShapeIsChecked)
{
  FilterBuilder fb(ctx);
  fb.eq(b.literal("x"), 1);
  const BuildResult r = fb.build();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error->tag, ErrorTag::ComparisonLeftShape);
  EXPECT_EQ(r.error->detail, "field must be a name or an index chain, got Literal");

  FilterBuilder bad_base(ctx);
  bad_base.index(b.literal("x"), 0);
  EXPECT_EQ(bad_base.build().error->tag, ErrorTag::ComparisonLeftShape);
}

TEST_F(AstFilterBuilderTest, FirstErrorWinsAndLaterCallsAreIgnored)
{
  FilterBuilder fb(ctx);
  fb.eq(static_cast<Expr *>(nullptr), 1)
    .gt("score", std::numeric_limits<double>::quiet_NaN())
    .or_scope([](FilterBuilder & s) { s.eq("b", 2); });
  EXPECT_EQ(fb.build().error->detail, "field is null");
}

TEST_F(AstFilterBuilderTest, ScopeErrorsPropagate)
{
  FilterBuilder fb(ctx);
  fb.eq("a", 1).and_scope(
    [](FilterBuilder & s) { s.eq("b", 2).not_scope([](FilterBuilder &) {}); });
  const BuildResult r = fb.build();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error->detail, "not scope added no conditions");
}
