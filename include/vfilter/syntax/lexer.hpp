// vfilter/syntax/lexer.hpp - Filter expression tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/unicode.hpp"
#include "vfilter/syntax/token.hpp"

namespace vfilter::syntax
{

/**
 * Converts UTF-8 filter text into tokens.
 *
 * Positions are 1-based and count code points. A token's `end` is the
 * position of its last character. String tokens carry the raw text between
 * the quotes; escape sequences are resolved by the parser.
 *
 * Lexing never fails: bad input becomes an ERROR token whose literal is the
 * message, and scanning continues after it.
 */
class Lexer
{
public:
  Lexer(AstContext & ctx, std::string_view src) : ctx_(ctx), src_(src) {}

  [[nodiscard]] Token next_token();

  /// All tokens up to and including exactly one EOF token.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char32_t peek(size_t lookahead = 0) const noexcept;
  [[nodiscard]] Position here() const noexcept { return {line_, column_}; }

  /// Consume one code point; returns it.
  char32_t advance() noexcept;

  void skip_whitespace();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_comparison(char32_t first);

  AstContext & ctx_;
  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
  Position last_;  ///< Position of the most recently consumed character
};

}  // namespace vfilter::syntax
