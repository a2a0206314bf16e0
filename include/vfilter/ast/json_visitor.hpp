// vfilter/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `vfilterc dump` and by tests that compare whole trees.
//
#pragma once

#include <nlohmann/json.hpp>

#include "vfilter/ast/ast.hpp"

namespace vfilter
{

/**
 * Serialize an expression tree to JSON.
 *
 * Every node object has "type" (the node class name) and "range"
 * ({"start": "L:C", "end": "L:C"}, or nulls for synthetic nodes).
 * A null node serializes as JSON null.
 */
[[nodiscard]] nlohmann::json to_json(const Expr * node);

}  // namespace vfilter
