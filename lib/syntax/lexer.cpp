// vfilter/syntax/lexer.cpp
#include "vfilter/syntax/lexer.hpp"

#include <fmt/core.h>

#include "vfilter/syntax/keywords.hpp"

namespace vfilter::syntax
{

char32_t Lexer::peek(size_t lookahead) const noexcept
{
  size_t offset = pos_;
  for (size_t i = 0; i < lookahead && offset < src_.size(); ++i) {
    offset += decode_utf8(src_, offset).length;
  }
  if (offset >= src_.size()) {
    return 0;
  }
  return decode_utf8(src_, offset).cp;
}

char32_t Lexer::advance() noexcept
{
  const DecodedChar ch = decode_utf8(src_, pos_);
  if (ch.length == 0) {
    return 0;
  }
  last_ = here();
  pos_ += ch.length;
  if (ch.cp == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return ch.cp;
}

void Lexer::skip_whitespace()
{
  while (!eof() && is_space(peek())) {
    advance();
  }
}

Token Lexer::lex_identifier_or_keyword()
{
  const Position start = here();
  const size_t begin = pos_;
  advance();
  while (!eof() && is_literal_char(peek())) {
    advance();
  }
  const std::string_view word = src_.substr(begin, pos_ - begin);

  // Keywords are case-insensitive and carry their canonical spelling
  const TokenKind kind = kind_of(word);
  if (kind != TokenKind::Ident) {
    return make_kind_token(kind, start, last_);
  }
  return make_ident_token(word, start, last_);
}

Token Lexer::lex_number()
{
  const Position start = here();
  const size_t begin = pos_;

  if (peek() == '-') {
    advance();
  }
  while (!eof() && is_ascii_digit(peek())) {
    advance();
  }

  // Fraction needs at least one digit after the dot
  if (peek() == '.') {
    advance();
    if (!is_ascii_digit(peek())) {
      if (eof()) {
        return make_error_token(ctx_, "unterminated number literal", start);
      }
      const Position bad = here();
      return make_illegal_token(ctx_, advance(), bad);
    }
    while (!eof() && is_ascii_digit(peek())) {
      advance();
    }
  }

  return make_literal_token(
    ctx_, TokenKind::Number, src_.substr(begin, pos_ - begin), start, last_);
}

Token Lexer::lex_string()
{
  const Position start = here();
  advance();  // opening quote
  const size_t payload_start = pos_;

  while (!eof()) {
    const char32_t c = peek();
    if (c == '\'') {
      const size_t payload_end = pos_;
      advance();
      return make_literal_token(
        ctx_, TokenKind::String, src_.substr(payload_start, payload_end - payload_start), start,
        last_);
    }
    if (c == '\\') {
      advance();
      if (eof()) {
        break;
      }
    }
    advance();
  }

  return make_error_token(ctx_, "unterminated string literal", start);
}

Token Lexer::lex_comparison(char32_t first)
{
  const Position start = here();
  advance();
  const bool has_eq = (peek() == '=');

  switch (first) {
    case '=':
    case '!':
      // Only the two-character forms exist
      if (!has_eq) {
        return make_illegal_token(ctx_, first, start);
      }
      advance();
      return make_kind_token(first == '=' ? TokenKind::Eq : TokenKind::Ne, start, last_);
    case '<':
      if (has_eq) {
        advance();
        return make_kind_token(TokenKind::Le, start, last_);
      }
      return make_kind_token(TokenKind::Lt, start, last_);
    default:
      if (has_eq) {
        advance();
        return make_kind_token(TokenKind::Ge, start, last_);
      }
      return make_kind_token(TokenKind::Gt, start, last_);
  }
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    return make_eof_token(here());
  }

  const char32_t c = peek();

  if (is_ascii_digit(c) || (c == '-' && is_ascii_digit(peek(1)))) {
    return lex_number();
  }
  if (is_letter(c)) {
    return lex_identifier_or_keyword();
  }
  if (c == '\'') {
    return lex_string();
  }

  const Position start = here();
  switch (c) {
    case '=':
    case '!':
    case '<':
    case '>':
      return lex_comparison(c);
    case '(':
      advance();
      return make_kind_token(TokenKind::LParen, start, start);
    case ')':
      advance();
      return make_kind_token(TokenKind::RParen, start, start);
    case '[':
      advance();
      return make_kind_token(TokenKind::LBrack, start, start);
    case ']':
      advance();
      return make_kind_token(TokenKind::RBrack, start, start);
    case ',':
      advance();
      return make_kind_token(TokenKind::Comma, start, start);
    default:
      break;
  }

  return make_illegal_token(ctx_, advance(), start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace vfilter::syntax
