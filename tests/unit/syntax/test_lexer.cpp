#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/syntax/lexer.hpp"
#include "vfilter/syntax/token.hpp"

using vfilter::AstContext;
using vfilter::Position;
using vfilter::syntax::Lexer;
using vfilter::syntax::Token;
using vfilter::syntax::TokenKind;

namespace
{

std::vector<Token> lex(AstContext & ctx, std::string_view src)
{
  Lexer lexer(ctx, src);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, ComparisonAndLogicalExpression)
{
  AstContext ctx;
  const auto toks = lex(ctx, "age >= 18 and status != 'active'");

  const std::vector<TokenKind> expected = {
    TokenKind::Ident, TokenKind::Ge,     TokenKind::Number, TokenKind::And,
    TokenKind::Ident, TokenKind::Ne,     TokenKind::String, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);

  EXPECT_EQ(toks[0].literal, "age");
  EXPECT_EQ(toks[0].start, (Position{1, 1}));
  EXPECT_EQ(toks[0].end, (Position{1, 3}));
  EXPECT_EQ(toks[1].start, (Position{1, 5}));
  EXPECT_EQ(toks[1].end, (Position{1, 6}));
  EXPECT_EQ(toks[2].literal, "18");
  EXPECT_EQ(toks[6].literal, "active");
  EXPECT_EQ(toks[6].start, (Position{1, 25}));
  EXPECT_EQ(toks[6].end, (Position{1, 32}));
}

TEST(SyntaxLexer, KeywordsAreCaseInsensitiveAndCanonical)
{
  AstContext ctx;
  const auto toks = lex(ctx, "AND Or nOt IN Like TRUE False");

  const std::vector<TokenKind> expected = {
    TokenKind::And,  TokenKind::Or,   TokenKind::Not,   TokenKind::In,
    TokenKind::Like, TokenKind::True, TokenKind::False, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[0].literal, "and");
  EXPECT_EQ(toks[4].literal, "like");
  EXPECT_EQ(toks[5].literal, "true");
}

TEST(SyntaxLexer, IdentifiersKeepTheirCase)
{
  AstContext ctx;
  const auto toks = lex(ctx, "userName _x1");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, TokenKind::Ident);
  EXPECT_EQ(toks[0].literal, "userName");
  // '_' is a literal character but cannot start an identifier
  EXPECT_EQ(toks[1].kind, TokenKind::Error);
}

TEST(SyntaxLexer, NumbersAreNormalized)
{
  AstContext ctx;
  const auto toks = lex(ctx, "007 1.50 -5 -0.25 3.0");
  ASSERT_EQ(toks.size(), 6u);
  EXPECT_EQ(toks[0].literal, "7");
  EXPECT_EQ(toks[1].literal, "1.5");
  EXPECT_EQ(toks[2].literal, "-5");
  EXPECT_EQ(toks[3].literal, "-0.25");
  EXPECT_EQ(toks[4].literal, "3");
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::Number) << i;
  }
  EXPECT_EQ(toks[2].start, (Position{1, 10}));
  EXPECT_EQ(toks[2].end, (Position{1, 11}));
}

TEST(SyntaxLexer, FractionNeedsADigit)
{
  AstContext ctx;
  {
    const auto toks = lex(ctx, "1.x");
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::Error);
    EXPECT_EQ(toks[0].literal, "illegal character 'x'");
    EXPECT_EQ(toks[0].start, (Position{1, 3}));
  }
  {
    const auto toks = lex(ctx, "1.");
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::Error);
  }
}

TEST(SyntaxLexer, LoneEqualsAndBangAreIllegal)
{
  AstContext ctx;
  const auto toks = lex(ctx, "a = 1");
  ASSERT_GE(toks.size(), 2u);
  EXPECT_EQ(toks[1].kind, TokenKind::Error);
  EXPECT_EQ(toks[1].literal, "illegal character '='");
  EXPECT_EQ(toks[1].start, (Position{1, 3}));

  const auto bang = lex(ctx, "!x");
  EXPECT_EQ(bang[0].kind, TokenKind::Error);
}

TEST(SyntaxLexer, MinusWithoutDigitIsIllegal)
{
  AstContext ctx;
  const auto toks = lex(ctx, "a - 1");
  ASSERT_GE(toks.size(), 2u);
  EXPECT_EQ(toks[1].kind, TokenKind::Error);
  EXPECT_EQ(toks[1].literal, "illegal character '-'");
}

TEST(SyntaxLexer, StringsKeepRawEscapes)
{
  AstContext ctx;
  const auto toks = lex(ctx, R"('it\'s' 'a\\b')");
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[0].kind, TokenKind::String);
  EXPECT_EQ(toks[0].literal, R"(it\'s)");
  EXPECT_EQ(toks[1].literal, R"(a\\b)");
}

TEST(SyntaxLexer, UnterminatedStringIsAnError)
{
  AstContext ctx;
  const auto toks = lex(ctx, "name == 'abc");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[2].kind, TokenKind::Error);
  EXPECT_EQ(toks[2].literal, "unterminated string literal");
  EXPECT_EQ(toks[2].start, (Position{1, 9}));
  EXPECT_EQ(toks[3].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NewlinesAdvanceLines)
{
  AstContext ctx;
  const auto toks = lex(ctx, "a\n  == 1");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[1].kind, TokenKind::Eq);
  EXPECT_EQ(toks[1].start, (Position{2, 3}));
  EXPECT_EQ(toks[2].start, (Position{2, 6}));
}

TEST(SyntaxLexer, NonAsciiLettersFormIdentifiers)
{
  AstContext ctx;
  const auto toks = lex(ctx, "名前 == 'x'");
  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].kind, TokenKind::Ident);
  EXPECT_EQ(toks[0].literal, "名前");
  EXPECT_EQ(toks[0].end, (Position{1, 2}));
  EXPECT_EQ(toks[1].start, (Position{1, 4}));
}

TEST(SyntaxLexer, PunctuationAndSingleEof)
{
  AstContext ctx;
  const auto toks = lex(ctx, "tags[0] in (1, 2)");
  const std::vector<TokenKind> expected = {
    TokenKind::Ident,  TokenKind::LBrack, TokenKind::Number, TokenKind::RBrack,
    TokenKind::In,     TokenKind::LParen, TokenKind::Number, TokenKind::Comma,
    TokenKind::Number, TokenKind::RParen, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);

  const auto empty = lex(ctx, "   ");
  ASSERT_EQ(empty.size(), 1u);
  EXPECT_EQ(empty[0].kind, TokenKind::Eof);
  EXPECT_FALSE(empty[0].start.is_valid());
}
