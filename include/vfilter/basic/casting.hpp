// vfilter/basic/casting.hpp - classof()-based casting helpers for AST nodes
//
// Usage:
//   if (isa<Literal>(node)) { ... }
//   const auto * bin = cast<BinaryExpr>(node);     // asserts on mismatch
//   if (const auto * idx = dyn_cast<IndexExpr>(node)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace vfilter
{

namespace detail
{

/// True when T::classof accepts a `const From *`
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// True iff `node` is non-null and of dynamic type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/// Checked downcast. The caller guarantees the type.
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Downcast returning nullptr on mismatch or null input.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace vfilter
