// vfilter/ast/sql_printer.hpp - Canonical SQL-like rendering of filter trees
#pragma once

#include <string>

#include "vfilter/ast/ast.hpp"

namespace vfilter
{

/**
 * Render `expr` in the canonical textual form.
 *
 * - identifiers and numbers verbatim, strings single-quoted without escaping
 * - lists as `(a,b)`, index as `base[key]`
 * - binary operands parenthesized only when they bind looser than the operator
 * - `not` always followed by a parenthesized operand
 *
 * A null tree renders as "".
 */
[[nodiscard]] std::string to_sql(const Expr * expr);

}  // namespace vfilter
