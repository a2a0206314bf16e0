// vfilter/ast/clone.hpp - Deep copy and structural equality of filter trees
#pragma once

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"

namespace vfilter
{

/**
 * Deep-copy `expr` into `dst`.
 *
 * Token text is re-interned in `dst`, so the copy stays valid after the
 * source context is gone. Positions are preserved. Returns nullptr for a
 * null input; null children stay null.
 */
[[nodiscard]] Expr * clone(AstContext & dst, const Expr * expr);

/**
 * Structural equality: same node kinds, operator kinds, token kinds and
 * values in the same shape. Positions are ignored.
 */
[[nodiscard]] bool equals(const Expr * a, const Expr * b);

}  // namespace vfilter
