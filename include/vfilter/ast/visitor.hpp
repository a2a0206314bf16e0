// vfilter/ast/visitor.hpp - Visitors for AST traversal
//
// Two flavours:
//  - AstVisitor: CRTP dispatch on NodeKind with per-node visit_* hooks.
//    Used by the printers and by clone/equality.
//  - ExprVisitor + walk(): a runtime visitor driven by a central
//    depth-first walk. Used by the analyzer and the translator.
//
#pragma once

#include <type_traits>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_enums.hpp"
#include "vfilter/basic/casting.hpp"

namespace vfilter
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor.
 *
 * Derived classes override visit_<snake>() for the node kinds they care
 * about. Unhandled atomic kinds fall back to visit_atomic(), computed kinds
 * to visit_computed(), and both end in visit_node().
 *
 * @code
 *   class CountIdents : public ConstAstVisitor<CountIdents, int> {
 *   public:
 *     int visit_ident(const Ident *) { return 1; }
 *     int visit_node(const AstNode *) { return 0; }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  /**
   * Visit a node, dispatching to the matching visit_<snake>() method.
   * A null node yields a value-initialized ReturnType.
   */
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_ATOMIC(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_COMPUTED(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "vfilter/ast/ast_nodes.def"
    }

    // Unreachable, but silences compiler warning
    return ReturnType();
  }

  // Default per-node hooks
#define AST_NODE_ATOMIC(Class, Kind, Snake)                                 \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_atomic(node);                                \
  }
#define AST_NODE_COMPUTED(Class, Kind, Snake)                               \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_computed(node);                              \
  }
#include "vfilter/ast/ast_nodes.def"

  // Category-level hooks
  ReturnType visit_atomic(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_computed(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// ExprVisitor + walk()
// ============================================================================

/**
 * Runtime visitor driven by walk().
 *
 * visit() returns the visitor to use for the node's children, or nullptr
 * to skip the subtree.
 */
class ExprVisitor
{
public:
  virtual ~ExprVisitor() = default;

  virtual ExprVisitor * visit(const Expr * node) = 0;

protected:
  ExprVisitor() = default;
  ExprVisitor(const ExprVisitor &) = default;
  ExprVisitor & operator=(const ExprVisitor &) = default;
};

/**
 * Depth-first traversal.
 *
 * Calls visitor.visit(node); when that returns a visitor, recurses into the
 * children in fixed order: unary right; binary left then right; index left
 * then index literal; paren inner; list elements in order. Null children
 * are passed to visit() so visitors can report them.
 */
void walk(ExprVisitor & visitor, const Expr * node);

}  // namespace vfilter
