// swlint/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns all AST nodes of one parsed file, allocated from a
// std::pmr::monotonic_buffer_resource.
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

namespace swlint
{

class AstNode;

/**
 * Arena that owns AST nodes and interned strings.
 *
 * Nodes are valid for the lifetime of the context; there is no individual
 * deallocation. Nodes must be trivially destructible (string_view and
 * gsl::span members only).
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * fn = ctx.create<FunctionDecl>(ctx.intern("f"), range);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  // PMR resources are not movable
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Create a node of type T in the arena.
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

  /// Intern a string and return a view that lives as long as the context.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  /// Copy a vector into arena storage.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace swlint
