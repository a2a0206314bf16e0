#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/ast/builder.hpp"

using namespace vfilter;

class AstBuilderTest : public ::testing::Test
{
protected:
  AstContext ctx;
  ExprBuilder b{ctx};
};

TEST_F(AstBuilderTest, ScalarLiterals)
{
  const Literal * s = b.literal("active");
  EXPECT_TRUE(s->is_string());
  EXPECT_EQ(s->value, "active");

  const Literal * t = b.literal(true);
  EXPECT_EQ(t->token.kind, TokenKind::True);
  EXPECT_EQ(t->as_bool(), std::optional<bool>(true));

  const Literal * f = b.literal(false);
  EXPECT_EQ(f->token.kind, TokenKind::False);
  EXPECT_EQ(f->as_bool(), std::optional<bool>(false));
}

TEST_F(AstBuilderTest, NumbersAreNormalized)
{
  EXPECT_EQ(b.literal(18)->value, "18");
  EXPECT_EQ(b.literal(uint64_t{42})->value, "42");
  EXPECT_EQ(b.literal(1.5)->value, "1.5");
  EXPECT_EQ(b.literal(-0.25f)->value, "-0.25");
  EXPECT_EQ(b.literal(1e20)->value, "100000000000000000000");
  EXPECT_EQ(b.number_literal("1.23e+02")->value, "123");

  // Normalized text parses back to the value it came from
  for (const double v : {0.1, 3.14159, 1e-7, 123456.789, -42.0}) {
    const Literal * lit = b.literal(v);
    ASSERT_TRUE(lit->as_number().has_value()) << lit->value;
    EXPECT_EQ(*lit->as_number(), v);
  }
}

TEST_F(AstBuilderTest, BadNumberTextBecomesAnErrorLiteral)
{
  const Literal * lit = b.number_literal("twelve");
  EXPECT_EQ(lit->token.kind, TokenKind::Error);
  EXPECT_FALSE(lit->as_number().has_value());
}

TEST_F(AstBuilderTest, IdentsAndPassThrough)
{
  Ident * id = b.ident("age");
  EXPECT_EQ(id->value, "age");
  EXPECT_EQ(id->token.kind, TokenKind::Ident);
  EXPECT_EQ(b.ident(id), id);

  Literal * lit = b.literal("x");
  EXPECT_EQ(b.literal(lit), lit);

  ListLiteral * l = b.list({1, 2});
  EXPECT_EQ(b.list(l), l);
}

TEST_F(AstBuilderTest, Lists)
{
  const ListLiteral * strings = b.list({"a", "b", "c"});
  ASSERT_EQ(strings->values.size(), 3u);
  EXPECT_EQ(strings->values[2]->value, "c");

  const ListLiteral * numbers = b.list(std::vector<double>{1.5, 2.5});
  ASSERT_EQ(numbers->values.size(), 2u);
  EXPECT_TRUE(numbers->values[0]->is_number());

  const ListLiteral * empty = b.list(std::vector<Literal *>{});
  EXPECT_TRUE(empty->values.empty());
}

TEST_F(AstBuilderTest, Comparisons)
{
  const BinaryExpr * eq = b.eq("status", "active");
  EXPECT_EQ(eq->op.kind, TokenKind::Eq);
  EXPECT_EQ(cast<Ident>(eq->left)->value, "status");
  EXPECT_EQ(cast<Literal>(eq->right)->value, "active");

  EXPECT_EQ(b.ne("deleted", true)->op.kind, TokenKind::Ne);
  EXPECT_EQ(b.lt("age", 18)->op.kind, TokenKind::Lt);
  EXPECT_EQ(b.le("age", 18)->op.kind, TokenKind::Le);
  EXPECT_EQ(b.gt("age", 18)->op.kind, TokenKind::Gt);
  EXPECT_EQ(b.ge("score", 2.5)->op.kind, TokenKind::Ge);

  // Runtime-typed values go through as expressions
  const BinaryExpr * bad = b.gt("age", b.literal("eighteen"));
  EXPECT_TRUE(cast<Literal>(bad->right)->is_string());
}

TEST_F(AstBuilderTest, MembershipAndLike)
{
  const BinaryExpr * in = b.in("status", {"active", "pending"});
  EXPECT_EQ(in->op.kind, TokenKind::In);
  ASSERT_TRUE(isa<ListLiteral>(in->right));
  EXPECT_EQ(cast<ListLiteral>(in->right)->values.size(), 2u);

  const BinaryExpr * in_vec = b.in("id", std::vector<int>{1, 2, 3});
  EXPECT_EQ(cast<ListLiteral>(in_vec->right)->values.size(), 3u);

  const BinaryExpr * like = b.like("name", "John%");
  EXPECT_EQ(like->op.kind, TokenKind::Like);
  EXPECT_EQ(cast<Literal>(like->right)->value, "John%");
}

TEST_F(AstBuilderTest, LogicalAndStructural)
{
  Expr * a = b.gt("age", 18);
  Expr * c = b.eq("status", "active");

  const BinaryExpr * conj = b.and_(a, c);
  EXPECT_EQ(conj->op.kind, TokenKind::And);
  EXPECT_EQ(conj->left, a);
  EXPECT_EQ(conj->right, c);
  EXPECT_EQ(b.or_(a, c)->op.kind, TokenKind::Or);

  const UnaryExpr * neg = b.not_(a);
  EXPECT_EQ(neg->op.kind, TokenKind::Not);
  EXPECT_EQ(neg->right, a);

  const ParenExpr * p = b.paren(a);
  EXPECT_EQ(p->inner, a);
  EXPECT_TRUE(is_computed(p));
}

TEST_F(AstBuilderTest, IndexChainsLeanLeft)
{
  const IndexExpr * outer = b.index(b.index("user", "profile"), "name");
  EXPECT_EQ(outer->index->value, "name");
  const auto * inner = dyn_cast<IndexExpr>(outer->left);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(cast<Ident>(inner->left)->value, "user");
  EXPECT_EQ(inner->index->value, "profile");

  const IndexExpr * numeric = b.index("tags", 0);
  EXPECT_TRUE(numeric->index->is_number());
}

TEST_F(AstBuilderTest, SyntheticNodesHaveNoPosition)
{
  const Expr * e = b.and_(b.eq("a", 1), b.not_(b.eq("b", 2)));
  EXPECT_FALSE(e->start().is_valid());
  EXPECT_FALSE(e->end().is_valid());
  EXPECT_TRUE(e->range().is_invalid());
}
