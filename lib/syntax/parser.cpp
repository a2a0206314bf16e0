// vfilter/syntax/parser.cpp
#include "vfilter/syntax/parser.hpp"

#include <fmt/core.h>

#include "vfilter/basic/unicode.hpp"

namespace vfilter::syntax
{
namespace
{

/// EOF and lexer error tokens only carry one usable position.
[[nodiscard]] SourceRange token_range(const Token & t)
{
  if (!t.start.is_valid()) {
    return {t.end, t.end};
  }
  return t.range();
}

[[nodiscard]] bool is_literal_kind(TokenKind k) noexcept
{
  return k == TokenKind::Number || k == TokenKind::String || k == TokenKind::True ||
         k == TokenKind::False;
}

}  // namespace

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::String:
      return fmt::format("string '{}'", t.literal);
    case TokenKind::Error:
      return "invalid token";
    default:
      return fmt::format("'{}'", t.literal);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_literal(size_t lookahead) const { return is_literal_kind(cur(lookahead).kind); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect_closing(TokenKind k, const Token & opener)
{
  if (match(k)) {
    return true;
  }

  const std::string_view closing = literal(k);
  failed_ = true;
  Diagnostic & d = diags_.error(
    token_range(cur()),
    fmt::format("expected '{}' but found {}", closing, describe(cur())),
    fmt::format("expected `{}`", closing));
  d.with_related(opener.range(), fmt::format("to match this '{}'", opener.literal));
  if (idx_ > 0) {
    d.insert_after(token_range(tokens_[idx_ - 1]).get_end(), std::string(closing));
  }
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  failed_ = true;
  diags_.error(token_range(t), std::string(msg));
}

bool Parser::enter_nested()
{
  if (depth_ >= options_.max_depth) {
    error_at(
      cur(), fmt::format("expression is nested too deeply (limit {})", options_.max_depth));
    return false;
  }
  ++depth_;
  return true;
}

// ============================================================================
// Entry
// ============================================================================

Expr * Parser::parse()
{
  if (tokens_.empty()) {
    tokens_.push_back(make_eof_token(Position{1, 1}));
  }

  Expr * root = parse_or();
  if (failed_ || root == nullptr) {
    return nullptr;
  }

  if (!at_eof()) {
    if (at(TokenKind::Error)) {
      error_at(cur(), cur().literal);
    } else {
      diags_
        .error(
          token_range(cur()),
          fmt::format("unexpected {} after complete expression", describe(cur())),
          "expected end of input")
        .with_help("combine conditions with 'and' or 'or'");
      failed_ = true;
    }
    return nullptr;
  }
  return root;
}

// ============================================================================
// Binary ladder
// ============================================================================

Expr * Parser::parse_or()
{
  Expr * left = parse_and();
  while (left != nullptr && at(TokenKind::Or)) {
    const Token op = advance();
    Expr * right = parse_and();
    if (right == nullptr) return nullptr;
    left = ast_.create<BinaryExpr>(left, op, right);
  }
  return left;
}

Expr * Parser::parse_and()
{
  Expr * left = parse_not();
  while (left != nullptr && at(TokenKind::And)) {
    const Token op = advance();
    Expr * right = parse_not();
    if (right == nullptr) return nullptr;
    left = ast_.create<BinaryExpr>(left, op, right);
  }
  return left;
}

Expr * Parser::parse_not()
{
  if (!at(TokenKind::Not)) {
    return parse_equality();
  }

  const Token op = advance();
  if (!enter_nested()) {
    return nullptr;
  }
  Expr * operand = parse_not();
  --depth_;
  if (operand == nullptr) {
    return nullptr;
  }
  return ast_.create<UnaryExpr>(op, operand);
}

Expr * Parser::parse_equality()
{
  Expr * left = parse_ordering();
  while (left != nullptr && (at(TokenKind::Eq) || at(TokenKind::Ne))) {
    const Token op = advance();
    Expr * right = parse_ordering();
    if (right == nullptr) return nullptr;
    left = ast_.create<BinaryExpr>(left, op, right);
  }
  return left;
}

Expr * Parser::parse_ordering()
{
  Expr * left = parse_membership();
  while (left != nullptr && is_ordering_operator(cur().kind)) {
    const Token op = advance();
    Expr * right = parse_membership();
    if (right == nullptr) return nullptr;
    left = ast_.create<BinaryExpr>(left, op, right);
  }
  return left;
}

Expr * Parser::parse_membership()
{
  Expr * left = parse_postfix();
  while (left != nullptr && (at(TokenKind::In) || at(TokenKind::Like))) {
    const Token op = advance();
    Expr * right = parse_postfix();
    if (right == nullptr) return nullptr;
    left = ast_.create<BinaryExpr>(left, op, right);
  }
  return left;
}

// ============================================================================
// Postfix / primary
// ============================================================================

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (e != nullptr && at(TokenKind::LBrack)) {
    const Token lb = advance();
    if (!at(TokenKind::Number) && !at(TokenKind::String)) {
      error_at(
        cur(), fmt::format("index must be a number or string literal, found {}", describe(cur())));
      return nullptr;
    }
    Literal * index = make_literal(advance());
    if (index == nullptr) return nullptr;
    const Token rb = cur();
    if (!expect_closing(TokenKind::RBrack, lb)) {
      return nullptr;
    }
    e = ast_.create<IndexExpr>(e, lb, index, rb);
  }
  return e;
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::Ident:
      advance();
      return ast_.create<Ident>(Token{t.kind, ast_.intern(t.literal), t.start, t.end});
    case TokenKind::Number:
    case TokenKind::String:
    case TokenKind::True:
    case TokenKind::False:
      return make_literal(advance());
    case TokenKind::LParen:
      return parse_paren_or_list();
    case TokenKind::Error:
      error_at(t, t.literal);
      return nullptr;
    case TokenKind::Eof:
      error_at(t, "expected an expression but found end of input");
      return nullptr;
    default:
      error_at(
        t, fmt::format(
             "expected an identifier, literal or '(' but found {}", describe(t)));
      return nullptr;
  }
}

Expr * Parser::parse_paren_or_list()
{
  const Token lp = advance();

  if (at(TokenKind::RParen)) {
    error_at(cur(), "empty parentheses are not allowed");
    return nullptr;
  }

  // `(lit)` and `(lit, ...)` are lists; anything else groups
  if (at_literal() && (cur(1).kind == TokenKind::Comma || cur(1).kind == TokenKind::RParen)) {
    return parse_list_tail(lp);
  }

  if (!enter_nested()) {
    return nullptr;
  }
  Expr * inner = parse_or();
  --depth_;
  if (inner == nullptr) {
    return nullptr;
  }

  const Token rp = cur();
  if (!expect_closing(TokenKind::RParen, lp)) {
    return nullptr;
  }
  return ast_.create<ParenExpr>(lp, inner, rp);
}

ListLiteral * Parser::parse_list_tail(const Token & lparen)
{
  std::vector<Literal *> values;

  while (true) {
    if (!at_literal()) {
      if (at(TokenKind::RParen) && !values.empty()) {
        error_at(cur(), "trailing comma is not allowed in a list");
      } else {
        error_at(
          cur(), fmt::format("list elements must be literal values, found {}", describe(cur())));
      }
      return nullptr;
    }
    Literal * lit = make_literal(advance());
    if (lit == nullptr) return nullptr;
    values.push_back(lit);

    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  const Token rp = cur();
  if (!expect_closing(TokenKind::RParen, lparen)) {
    return nullptr;
  }
  return ast_.create<ListLiteral>(lparen, ast_.copy_to_arena(values), rp);
}

Literal * Parser::make_literal(const Token & t)
{
  if (t.kind != TokenKind::String) {
    return ast_.create<Literal>(Token{t.kind, ast_.intern(t.literal), t.start, t.end});
  }
  const std::string s = unescape_string(t.literal, t);
  return ast_.create<Literal>(Token{t.kind, ast_.intern(s), t.start, t.end});
}

std::string Parser::unescape_string(std::string_view raw, const Token & tok_for_diag)
{
  std::string out;
  out.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    // The lexer never ends a string on a lone backslash
    if (i + 1 >= raw.size()) {
      break;
    }

    const DecodedChar esc = decode_utf8(raw, i + 1);
    i += esc.length;
    switch (esc.cp) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '\'':
        out.push_back('\'');
        break;
      case '\\':
        out.push_back('\\');
        break;
      default: {
        std::string shown;
        append_utf8(shown, esc.cp);
        diags_
          .warning(
            tok_for_diag.range(), fmt::format("unknown escape sequence '\\{}'", shown),
            "escape kept as the plain character")
          .with_help("supported escapes are \\n, \\t, \\r, \\' and \\\\");
        out += shown;
        break;
      }
    }
  }
  return out;
}

}  // namespace vfilter::syntax
