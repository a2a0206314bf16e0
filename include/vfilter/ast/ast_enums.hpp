// vfilter/ast/ast_enums.hpp - AST node kinds
//
// Generated from ast_nodes.def. Atomic kinds come first so the
// atomic/computed split is a single range check.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace vfilter
{

enum class NodeKind : uint8_t {
// === Atomic ===
#define AST_NODE_ATOMIC(Class, Kind, Snake) Kind,
#include "vfilter/ast/ast_nodes.def"

// === Computed ===
#define AST_NODE_COMPUTED(Class, Kind, Snake) Kind,
#include "vfilter/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_atomic_kind(NodeKind k) noexcept
{
  return k <= NodeKind::ListLiteral;
}

[[nodiscard]] constexpr bool is_computed_kind(NodeKind k) noexcept
{
  return k >= NodeKind::UnaryExpr && k <= NodeKind::ParenExpr;
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_ATOMIC(Class, Kind, Snake) \
  case NodeKind::Kind:                      \
    return #Class;
#define AST_NODE_COMPUTED(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return #Class;
#include "vfilter/ast/ast_nodes.def"
  }
  return "<unknown>";
}

}  // namespace vfilter
