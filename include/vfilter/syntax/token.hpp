// vfilter/syntax/token.hpp - Token kinds, precedence and token factories
//
// Token literals are views. Views produced by the lexer point into the
// source text; factories that synthesize text intern it in an AstContext.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "vfilter/basic/source_manager.hpp"

namespace vfilter
{
class AstContext;
}  // namespace vfilter

namespace vfilter::syntax
{

enum class TokenKind : uint8_t {
  Error,
  Eof,

  Ident,
  Number,
  String,
  True,
  False,

  // Comparison operators
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  // Keyword operators
  And,
  Or,
  Not,
  In,
  Like,

  // Punctuation
  LParen,
  RParen,
  LBrack,
  RBrack,
  Comma,
};

// ============================================================================
// Precedence ladder (higher binds tighter)
// ============================================================================

inline constexpr int k_prec_lowest = 0;
inline constexpr int k_prec_or = 1;
inline constexpr int k_prec_and = 2;
inline constexpr int k_prec_not = 3;
inline constexpr int k_prec_equality = 4;
inline constexpr int k_prec_ordering = 5;
inline constexpr int k_prec_membership = 6;

// ============================================================================
// Kind queries
// ============================================================================

[[nodiscard]] constexpr bool is_valid(TokenKind k) noexcept
{
  return static_cast<uint8_t>(k) <= static_cast<uint8_t>(TokenKind::Comma);
}

/// Upper-case kind name ("IDENT", "LPAREN", ...). Throws std::logic_error for invalid kinds.
[[nodiscard]] std::string_view name(TokenKind k);

/// Canonical spelling ("==", "and", "("); empty for kinds without one.
/// Throws std::logic_error for invalid kinds.
[[nodiscard]] std::string_view literal(TokenKind k);

[[nodiscard]] bool is_keyword(TokenKind k);
[[nodiscard]] bool is_binary_operator(TokenKind k);
[[nodiscard]] bool is_unary_operator(TokenKind k);
[[nodiscard]] bool is_operator(TokenKind k);
[[nodiscard]] bool is_logical_operator(TokenKind k);
[[nodiscard]] bool is_equality_operator(TokenKind k);
[[nodiscard]] bool is_ordering_operator(TokenKind k);

/// Binding strength per the ladder above; 0 for non-operators.
[[nodiscard]] int precedence(TokenKind k);

// ============================================================================
// Token
// ============================================================================

struct Token
{
  TokenKind kind = TokenKind::Error;
  std::string_view literal;
  Position start;
  Position end;  ///< Position of the last character (inclusive)

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] SourceRange range() const noexcept { return {start, end}; }
};

/// Raw token; no validation.
[[nodiscard]] Token make_token(
  TokenKind kind, std::string_view literal, Position start = k_no_position,
  Position end = k_no_position);

/// Token whose literal is the kind's canonical spelling.
[[nodiscard]] Token make_kind_token(
  TokenKind kind, Position start = k_no_position, Position end = k_no_position);

[[nodiscard]] Token make_ident_token(
  std::string_view ident, Position start = k_no_position, Position end = k_no_position);

/// EOF token: start is k_no_position, end is `pos`.
[[nodiscard]] Token make_eof_token(Position pos);

/// ERROR token carrying `message` ("unexpected error" when empty); end is k_no_position.
[[nodiscard]] Token make_error_token(AstContext & ctx, std::string_view message, Position pos);

/// ERROR token for "illegal character 'X'" starting at `pos`.
[[nodiscard]] Token make_illegal_token(AstContext & ctx, char32_t ch, Position pos);

/**
 * Literal token for STRING, NUMBER, TRUE or FALSE.
 *
 * NUMBER text is normalized (see normalize_number). Other kinds, and number
 * text that does not parse, produce an ERROR token.
 */
[[nodiscard]] Token make_literal_token(
  AstContext & ctx, TokenKind kind, std::string_view literal, Position start = k_no_position,
  Position end = k_no_position);

// ============================================================================
// Numbers
// ============================================================================

/**
 * Strict parse of a whole string as a finite 64-bit float.
 *
 * Locale independent. Hex forms, surrounding whitespace, and values that
 * overflow or underflow a double are rejected.
 */
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

/// Shortest round-trip decimal form without exponent ("123", "0.000123").
[[nodiscard]] std::string format_number(double value);

/// parse_number followed by format_number; nullopt when the text is not a number.
[[nodiscard]] std::optional<std::string> normalize_number(std::string_view text);

}  // namespace vfilter::syntax
