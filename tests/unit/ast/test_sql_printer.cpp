#include <gtest/gtest.h>

#include <string>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/ast/sql_printer.hpp"
#include "vfilter/test_support/parse_helpers.hpp"

using namespace vfilter;
using vfilter::test_support::parse;

namespace
{

std::string format(const std::string & src)
{
  auto unit = parse(src);
  EXPECT_TRUE(unit.ok()) << src << ": " << unit.first_error();
  return to_sql(unit.root);
}

}  // namespace

TEST(AstSqlPrinter, BuiltTrees)
{
  AstContext ctx;
  ExprBuilder b(ctx);

  EXPECT_EQ(to_sql(b.eq("status", "active")), "status == 'active'");
  EXPECT_EQ(to_sql(b.gt("age", 18)), "age > 18");
  EXPECT_EQ(to_sql(b.ge("score", 2.5)), "score >= 2.5");
  EXPECT_EQ(to_sql(b.in("s", {"a", "b"})), "s in ('a','b')");
  EXPECT_EQ(to_sql(b.in("id", {1, 2, 3})), "id in (1,2,3)");
  EXPECT_EQ(to_sql(b.like("name", "John%")), "name like 'John%'");
  EXPECT_EQ(to_sql(b.not_(b.eq("deleted", true))), "not (deleted == true)");
  EXPECT_EQ(
    to_sql(b.eq(b.index(b.index("user", "profile"), "name"), "Alice")),
    "user['profile']['name'] == 'Alice'");
  EXPECT_EQ(to_sql(b.index("tags", 0)), "tags[0]");
}

TEST(AstSqlPrinter, LowerPrecedenceOperandsGetParentheses)
{
  AstContext ctx;
  ExprBuilder b(ctx);

  EXPECT_EQ(
    to_sql(b.and_(b.eq("a", 1), b.or_(b.eq("b", 2), b.eq("c", 3)))),
    "a == 1 and (b == 2 or c == 3)");
  EXPECT_EQ(
    to_sql(b.or_(b.and_(b.eq("a", 1), b.eq("b", 2)), b.eq("c", 3))),
    "a == 1 and b == 2 or c == 3");
  EXPECT_EQ(
    to_sql(b.and_(b.and_(b.eq("a", 1), b.eq("b", 2)), b.eq("c", 3))),
    "a == 1 and b == 2 and c == 3");
}

TEST(AstSqlPrinter, ParenthesesAreNotDoubled)
{
  AstContext ctx;
  ExprBuilder b(ctx);

  EXPECT_EQ(
    to_sql(b.and_(b.paren(b.or_(b.eq("a", 1), b.eq("b", 2))), b.eq("c", 3))),
    "(a == 1 or b == 2) and c == 3");
  EXPECT_EQ(to_sql(b.not_(b.paren(b.eq("a", 1)))), "not (a == 1)");
}

TEST(AstSqlPrinter, ParsedTextIsCanonicalized)
{
  EXPECT_EQ(format("A==1 AND (B==2 OR C==3)"), "A == 1 and (B == 2 or C == 3)");
  EXPECT_EQ(format("not deleted == TRUE"), "not (deleted == true)");
  EXPECT_EQ(format("x IN (1.50, 020)"), "x in (1.5,20)");
  EXPECT_EQ(format("x in (1)"), "x in (1)");
  EXPECT_EQ(format("user [ 'a' ] [ 0 ] >= -3"), "user['a'][0] >= -3");
}

TEST(AstSqlPrinter, OutputReparsesToTheSameForm)
{
  for (const char * src :
       {"a == 1 and b == 2 or c == 3", "not (a == 1 or b != 'x')", "tags[0] in ('a', 'b')",
        "(a > 1 and (b < 2 or c <= 3)) or not d like 'z%'", "名前 == 'テスト'"}) {
    const std::string once = format(src);
    EXPECT_EQ(format(once), once) << src;
  }
}

TEST(AstSqlPrinter, NullTreeIsEmpty) { EXPECT_EQ(to_sql(nullptr), ""); }
