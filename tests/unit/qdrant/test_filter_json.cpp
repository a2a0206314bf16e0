#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"
#include "vfilter/qdrant/filter.hpp"
#include "vfilter/qdrant/filter_json.hpp"
#include "vfilter/qdrant/translator.hpp"

using namespace vfilter;
using namespace vfilter::qdrant;
using nlohmann::json;

TEST(QdrantFilterJson, EmptyFilterIsAnEmptyObject)
{
  EXPECT_EQ(to_json(Filter{}), json::object());
}

TEST(QdrantFilterJson, FieldConditionShapes)
{
  EXPECT_EQ(
    to_json(Condition::make_field("status", MatchKeyword{"active"})),
    json::parse(R"({"key": "status", "match": {"value": "active"}})"));
  EXPECT_EQ(
    to_json(Condition::make_field("n", MatchInteger{-7})),
    json::parse(R"({"key": "n", "match": {"value": -7}})"));
  EXPECT_EQ(
    to_json(Condition::make_field("ok", MatchBool{true})),
    json::parse(R"({"key": "ok", "match": {"value": true}})"));
  EXPECT_EQ(
    to_json(Condition::make_field("s", MatchKeywords{{"a", "b"}})),
    json::parse(R"({"key": "s", "match": {"any": ["a", "b"]}})"));
  EXPECT_EQ(
    to_json(Condition::make_field("id", MatchIntegers{{1, 2}})),
    json::parse(R"({"key": "id", "match": {"any": [1, 2]}})"));
  EXPECT_EQ(
    to_json(Condition::make_field("name", MatchText{"J%"})),
    json::parse(R"({"key": "name", "match": {"text": "J%"}})"));

  Range r;
  r.gte = 1.5;
  r.lt = 10.0;
  EXPECT_EQ(
    to_json(Condition::make_field("score", r)),
    json::parse(R"({"key": "score", "range": {"gte": 1.5, "lt": 10.0}})"));
}

TEST(QdrantFilterJson, TranslatedFilter)
{
  AstContext ctx;
  ExprBuilder b(ctx);
  const TranslateResult result = translate(b.and_(
    b.gt("age", 18),
    b.and_(b.or_(b.eq("status", "active"), b.in("flag", {true})), b.not_(b.like("name", "x%")))));
  ASSERT_TRUE(result.ok()) << result.error->message();

  const json expected = json::parse(R"({
    "must": [
      {"key": "age", "range": {"gt": 18.0}},
      {"should": [
        {"key": "status", "match": {"value": "active"}},
        {"should": [{"key": "flag", "match": {"value": true}}]}
      ]},
      {"must_not": [{"key": "name", "match": {"text": "x%"}}]}
    ]
  })");
  EXPECT_EQ(to_json(result.filter), expected) << to_json(result.filter).dump(2);
}
