// vfilter/ast/ast_context.hpp - Arena for AST nodes and interned text
//
// Nodes never own heap memory. Their strings are views into this pool and
// their child arrays are spans into this arena, so the whole tree is freed
// at once with the context.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace vfilter
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Owns all AST nodes and interned strings of one or more trees.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * id = ctx.create<Ident>(make_ident_token(ctx.intern("age")));
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB); filter trees are small
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /**
   * Intern a string and return a view that lives as long as the context.
   * Equal strings share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) {
      return {};
    }
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  /// Copy a vector into an arena-allocated array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_copyable_v<T>, "arena arrays hold trivially copyable values");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * vec.size(), alignof(T)));
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace vfilter
