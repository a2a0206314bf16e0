#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/ast/json_visitor.hpp"
#include "vfilter/test_support/parse_helpers.hpp"

using namespace vfilter;
using vfilter::test_support::parse;
using nlohmann::json;

TEST(AstJsonDump, ComparisonWithRanges)
{
  auto unit = parse("age >= 18");
  ASSERT_TRUE(unit.ok()) << unit.first_error();

  const json j = to_json(unit.root);
  EXPECT_EQ(j["type"], "BinaryExpr");
  EXPECT_EQ(j["op"], ">=");
  EXPECT_EQ(j["range"]["start"], "1:1");
  EXPECT_EQ(j["range"]["end"], "1:9");

  EXPECT_EQ(j["lhs"]["type"], "Ident");
  EXPECT_EQ(j["lhs"]["name"], "age");
  EXPECT_EQ(j["lhs"]["range"]["end"], "1:3");

  EXPECT_EQ(j["rhs"]["type"], "Literal");
  EXPECT_EQ(j["rhs"]["kind"], "NUMBER");
  EXPECT_EQ(j["rhs"]["text"], "18");
  EXPECT_EQ(j["rhs"]["value"], 18.0);
}

TEST(AstJsonDump, AllNodeShapes)
{
  auto unit = parse("not (user['tags'][0] in ('a', 'b') and ok == true)");
  ASSERT_TRUE(unit.ok()) << unit.first_error();

  const json j = to_json(unit.root);
  EXPECT_EQ(j["type"], "UnaryExpr");
  EXPECT_EQ(j["op"], "not");

  const json & paren = j["operand"];
  EXPECT_EQ(paren["type"], "ParenExpr");

  const json & conj = paren["inner"];
  EXPECT_EQ(conj["op"], "and");

  const json & member = conj["lhs"];
  EXPECT_EQ(member["op"], "in");
  EXPECT_EQ(member["lhs"]["type"], "IndexExpr");
  EXPECT_EQ(member["lhs"]["base"]["type"], "IndexExpr");
  EXPECT_EQ(member["lhs"]["base"]["base"]["name"], "user");
  EXPECT_EQ(member["lhs"]["base"]["index"]["value"], "tags");
  EXPECT_EQ(member["lhs"]["index"]["value"], 0.0);

  const json & values = member["rhs"]["values"];
  ASSERT_TRUE(values.is_array());
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[1]["kind"], "STRING");
  EXPECT_EQ(values[1]["value"], "b");

  EXPECT_EQ(conj["rhs"]["rhs"]["kind"], "TRUE");
  EXPECT_EQ(conj["rhs"]["rhs"]["value"], true);
}

TEST(AstJsonDump, SyntheticNodesHaveNullRanges)
{
  AstContext ctx;
  ExprBuilder b(ctx);

  const json j = to_json(b.eq("a", "x"));
  EXPECT_TRUE(j["range"]["start"].is_null());
  EXPECT_TRUE(j["range"]["end"].is_null());
  EXPECT_TRUE(j["rhs"]["range"]["start"].is_null());
}

TEST(AstJsonDump, NullTreeIsNull) { EXPECT_TRUE(to_json(nullptr).is_null()); }
