// vfilter/syntax/token.cpp - Token kind tables and factories
#include "vfilter/syntax/token.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <stdexcept>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/unicode.hpp"

namespace vfilter::syntax
{
namespace
{

void require_valid(TokenKind k)
{
  if (!is_valid(k)) {
    throw std::logic_error(fmt::format("invalid token kind: {}", static_cast<int>(k)));
  }
}

}  // namespace

std::string_view name(TokenKind k)
{
  require_valid(k);
  switch (k) {
    case TokenKind::Error:
      return "ERROR";
    case TokenKind::Eof:
      return "EOF";
    case TokenKind::Ident:
      return "IDENT";
    case TokenKind::Number:
      return "NUMBER";
    case TokenKind::String:
      return "STRING";
    case TokenKind::True:
      return "TRUE";
    case TokenKind::False:
      return "FALSE";
    case TokenKind::Eq:
      return "EQ";
    case TokenKind::Ne:
      return "NE";
    case TokenKind::Lt:
      return "LT";
    case TokenKind::Le:
      return "LE";
    case TokenKind::Gt:
      return "GT";
    case TokenKind::Ge:
      return "GE";
    case TokenKind::And:
      return "AND";
    case TokenKind::Or:
      return "OR";
    case TokenKind::Not:
      return "NOT";
    case TokenKind::In:
      return "IN";
    case TokenKind::Like:
      return "LIKE";
    case TokenKind::LParen:
      return "LPAREN";
    case TokenKind::RParen:
      return "RPAREN";
    case TokenKind::LBrack:
      return "LBRACK";
    case TokenKind::RBrack:
      return "RBRACK";
    case TokenKind::Comma:
      return "COMMA";
  }
  return "";
}

std::string_view literal(TokenKind k)
{
  require_valid(k);
  switch (k) {
    case TokenKind::True:
      return "true";
    case TokenKind::False:
      return "false";
    case TokenKind::Eq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::And:
      return "and";
    case TokenKind::Or:
      return "or";
    case TokenKind::Not:
      return "not";
    case TokenKind::In:
      return "in";
    case TokenKind::Like:
      return "like";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrack:
      return "[";
    case TokenKind::RBrack:
      return "]";
    case TokenKind::Comma:
      return ",";
    default:
      return "";
  }
}

bool is_keyword(TokenKind k)
{
  require_valid(k);
  switch (k) {
    case TokenKind::True:
    case TokenKind::False:
    case TokenKind::And:
    case TokenKind::Or:
    case TokenKind::Not:
    case TokenKind::In:
    case TokenKind::Like:
      return true;
    default:
      return false;
  }
}

bool is_logical_operator(TokenKind k)
{
  require_valid(k);
  return k == TokenKind::And || k == TokenKind::Or;
}

bool is_equality_operator(TokenKind k)
{
  require_valid(k);
  return k == TokenKind::Eq || k == TokenKind::Ne;
}

bool is_ordering_operator(TokenKind k)
{
  require_valid(k);
  return k == TokenKind::Lt || k == TokenKind::Le || k == TokenKind::Gt || k == TokenKind::Ge;
}

bool is_binary_operator(TokenKind k)
{
  return is_logical_operator(k) || is_equality_operator(k) || is_ordering_operator(k) ||
         k == TokenKind::In || k == TokenKind::Like;
}

bool is_unary_operator(TokenKind k)
{
  require_valid(k);
  return k == TokenKind::Not;
}

bool is_operator(TokenKind k) { return is_binary_operator(k) || is_unary_operator(k); }

int precedence(TokenKind k)
{
  require_valid(k);
  switch (k) {
    case TokenKind::Or:
      return k_prec_or;
    case TokenKind::And:
      return k_prec_and;
    case TokenKind::Not:
      return k_prec_not;
    case TokenKind::Eq:
    case TokenKind::Ne:
      return k_prec_equality;
    case TokenKind::Lt:
    case TokenKind::Le:
    case TokenKind::Gt:
    case TokenKind::Ge:
      return k_prec_ordering;
    case TokenKind::In:
    case TokenKind::Like:
      return k_prec_membership;
    default:
      return k_prec_lowest;
  }
}

// ============================================================================
// Factories
// ============================================================================

Token make_token(TokenKind kind, std::string_view literal, Position start, Position end)
{
  return Token{kind, literal, start, end};
}

Token make_kind_token(TokenKind kind, Position start, Position end)
{
  return Token{kind, literal(kind), start, end};
}

Token make_ident_token(std::string_view ident, Position start, Position end)
{
  return Token{TokenKind::Ident, ident, start, end};
}

Token make_eof_token(Position pos) { return Token{TokenKind::Eof, {}, k_no_position, pos}; }

Token make_error_token(AstContext & ctx, std::string_view message, Position pos)
{
  const std::string_view text = message.empty() ? std::string_view("unexpected error") : message;
  return Token{TokenKind::Error, ctx.intern(text), pos, k_no_position};
}

Token make_illegal_token(AstContext & ctx, char32_t ch, Position pos)
{
  std::string shown;
  append_utf8(shown, ch);
  return make_error_token(ctx, fmt::format("illegal character '{}'", shown), pos);
}

Token make_literal_token(
  AstContext & ctx, TokenKind kind, std::string_view literal, Position start, Position end)
{
  switch (kind) {
    case TokenKind::String:
    case TokenKind::True:
    case TokenKind::False:
      return Token{kind, ctx.intern(literal), start, end};
    case TokenKind::Number: {
      const auto normalized = normalize_number(literal);
      if (!normalized) {
        return make_error_token(
          ctx, fmt::format("invalid number literal '{}'", literal), start);
      }
      return Token{kind, ctx.intern(*normalized), start, end};
    }
    default:
      return make_error_token(
        ctx, fmt::format("unsupported literal kind {}", name(kind)), start);
  }
}

// ============================================================================
// Numbers
// ============================================================================

std::optional<double> parse_number(std::string_view text)
{
  // from_chars takes no '+' sign
  if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
    text.remove_prefix(1);
  }

  double v = 0.0;
  const char * first = text.data();
  const char * last = text.data() + text.size();
  const auto res = std::from_chars(first, last, v, std::chars_format::general);
  if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

std::string format_number(double value)
{
  // Large enough for the longest fixed-notation double (denormals)
  char buf[400];
  const auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
  if (res.ec != std::errc()) {
    return fmt::format("{}", value);
  }
  return std::string(buf, res.ptr);
}

std::optional<std::string> normalize_number(std::string_view text)
{
  const auto value = parse_number(text);
  if (!value) {
    return std::nullopt;
  }
  return format_number(*value);
}

}  // namespace vfilter::syntax
