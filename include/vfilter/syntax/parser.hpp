// vfilter/syntax/parser.hpp - Recursive-descent filter expression parser
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/diagnostic.hpp"
#include "vfilter/syntax/token.hpp"

namespace vfilter::syntax
{

struct ParserOptions
{
  /// Maximum nesting of parentheses and `not` before the parser gives up.
  uint32_t max_depth = 256;
};

/**
 * Parses a token stream into an expression tree.
 *
 * Grammar, loosest binding first:
 *
 *   or         := and ("or" and)*
 *   and        := not ("and" not)*
 *   not        := "not" not | equality
 *   equality   := ordering (("==" | "!=") ordering)*
 *   ordering   := membership (("<" | "<=" | ">" | ">=") membership)*
 *   membership := postfix (("in" | "like") postfix)*
 *   postfix    := primary ("[" literal "]")*
 *   primary    := IDENT | literal | "(" or ")" | "(" literal ("," literal)* ")"
 *
 * The parser stops at the first error; parse() then returns nullptr and the
 * diagnostic is in the bag.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens,
    ParserOptions options = {})
  : ast_(ast), diags_(diags), tokens_(std::move(tokens)), options_(options)
  {
  }

  [[nodiscard]] Expr * parse();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_literal(size_t lookahead = 0) const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect_closing(TokenKind k, const Token & opener);

  void error_at(const Token & t, std::string_view msg);
  bool enter_nested();

  // Expressions
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_not();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_ordering();
  [[nodiscard]] Expr * parse_membership();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_paren_or_list();
  [[nodiscard]] ListLiteral * parse_list_tail(const Token & lparen);

  [[nodiscard]] Literal * make_literal(const Token & t);
  [[nodiscard]] std::string unescape_string(std::string_view raw, const Token & tok_for_diag);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  ParserOptions options_;
  size_t idx_ = 0;
  uint32_t depth_ = 0;
  bool failed_ = false;
};

/// Human-readable description of a token for messages ("'=='", "end of input").
[[nodiscard]] std::string describe(const Token & t);

}  // namespace vfilter::syntax
