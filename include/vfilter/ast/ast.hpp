// vfilter/ast/ast.hpp - AST node class definitions for filter expressions
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() for
// isa/cast/dyn_cast. Every node is an expression. The atomic/computed
// split is a predicate on the kind, not a class in the hierarchy.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "vfilter/ast/ast_enums.hpp"
#include "vfilter/basic/casting.hpp"
#include "vfilter/basic/source_manager.hpp"
#include "vfilter/syntax/token.hpp"

namespace vfilter
{

using syntax::Token;
using syntax::TokenKind;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable, immutable after construction, and owned by an
 * AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  explicit AstNode(NodeKind k) : kind(k) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * Base class for expressions.
 *
 * start()/end() bracket the span of the node's tokens; synthetic nodes
 * report k_no_position.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return node != nullptr; }

  [[nodiscard]] Position start() const noexcept;
  [[nodiscard]] Position end() const noexcept;
  [[nodiscard]] SourceRange range() const noexcept { return {start(), end()}; }

protected:
  explicit Expr(NodeKind k) : AstNode(k) {}
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  NodeBase() : Base(K) {}
};

// ============================================================================
// Atomic Nodes
// ============================================================================

/// Field reference such as `age` or `user`.
class Ident : public NodeBase<Ident, Expr, NodeKind::Ident>
{
public:
  Token token;
  std::string_view value;

  explicit Ident(Token tok) : token(tok), value(tok.literal) {}
};

/// Scalar literal: string, number or boolean.
class Literal : public NodeBase<Literal, Expr, NodeKind::Literal>
{
public:
  Token token;
  std::string_view value;  ///< Normalized text for numbers, unescaped text for strings

  explicit Literal(Token tok) : token(tok), value(tok.literal) {}

  [[nodiscard]] bool is_string() const noexcept { return token.kind == TokenKind::String; }
  [[nodiscard]] bool is_number() const noexcept { return token.kind == TokenKind::Number; }
  [[nodiscard]] bool is_bool() const noexcept
  {
    return token.kind == TokenKind::True || token.kind == TokenKind::False;
  }

  /// Numeric value; nullopt unless this is a NUMBER whose text parses.
  [[nodiscard]] std::optional<double> as_number() const;

  /// Boolean value; nullopt unless this is TRUE/FALSE spelled consistently.
  [[nodiscard]] std::optional<bool> as_bool() const;

  /// String, number and bool are the three scalar classes; TRUE and FALSE share one.
  [[nodiscard]] bool is_same_kind(const Literal & other) const noexcept;
};

/// Parenthesized list of literals: `('a', 'b')`.
class ListLiteral : public NodeBase<ListLiteral, Expr, NodeKind::ListLiteral>
{
public:
  Token lparen;
  Token rparen;
  gsl::span<Literal *> values;

  ListLiteral(Token lp, gsl::span<Literal *> vals, Token rp)
  : lparen(lp), rparen(rp), values(vals)
  {
  }
};

// ============================================================================
// Computed Nodes
// ============================================================================

/// `not <right>`
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  Token op;
  Expr * right;

  UnaryExpr(Token o, Expr * r) : op(o), right(r) {}

  [[nodiscard]] int precedence() const { return syntax::precedence(op.kind); }
  [[nodiscard]] bool is_right_lower() const;
};

/// `<left> <op> <right>` for comparison, membership and logical operators.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * left;
  Token op;
  Expr * right;

  BinaryExpr(Expr * l, Token o, Expr * r) : left(l), op(o), right(r) {}

  [[nodiscard]] int precedence() const { return syntax::precedence(op.kind); }
  [[nodiscard]] bool is_left_lower() const;
  [[nodiscard]] bool is_right_lower() const;
};

/// `<left>[<index>]`; chains flatten to dotted field paths.
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Token lbrack;
  Token rbrack;
  Expr * left;
  Literal * index;

  IndexExpr(Expr * l, Token lb, Literal * i, Token rb)
  : lbrack(lb), rbrack(rb), left(l), index(i)
  {
  }
};

/// `( <inner> )`
class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::ParenExpr>
{
public:
  Token lparen;
  Token rparen;
  Expr * inner;

  ParenExpr(Token lp, Expr * in, Token rp) : lparen(lp), rparen(rp), inner(in) {}
};

// ============================================================================
// Predicates
// ============================================================================

/// Identifier, literal or list literal.
[[nodiscard]] inline bool is_atomic(const Expr * e) noexcept
{
  return e != nullptr && is_atomic_kind(e->get_kind());
}

/// Unary, binary, index or parenthesized expression.
[[nodiscard]] inline bool is_computed(const Expr * e) noexcept
{
  return e != nullptr && is_computed_kind(e->get_kind());
}

/// Binary and unary nodes carry an operator precedence.
[[nodiscard]] inline bool has_precedence(const Expr * e) noexcept
{
  return isa<BinaryExpr>(e) || isa<UnaryExpr>(e);
}

/// Operator precedence of a binary or unary node; 0 for everything else.
[[nodiscard]] int precedence_of(const Expr * e);

/// Looks through any number of ParenExpr wrappers.
[[nodiscard]] const Expr * strip_parens(const Expr * e) noexcept;

}  // namespace vfilter
