// apigen/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns all AST nodes, node arrays and interned strings of one
// generation pass. Uses std::pmr::monotonic_buffer_resource for arena
// allocation.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace apigen
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all AST nodes and interned strings using PMR.
 *
 * All AST nodes created through this context are valid as long as the
 * context is alive. Nothing is freed individually; memory is released when
 * the context is destroyed.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto* type = ctx.create<TypeRef>(ctx.intern("System.String"));
 *   auto* field = ctx.create<FieldDecl>(type, ctx.intern("name"));
 *   ctx.append(cls->members, field);
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB); a decorated service class is small.
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T in the arena.
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

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   *
   * Interning the same contents twice returns views over the same storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return stringPool_.find(s) != stringPool_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of T from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy elements from a vector to an arena-allocated array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(std::initializer_list<T> items)
  {
    auto span = allocate_array<T>(items.size());
    std::copy(items.begin(), items.end(), span.begin());
    return span;
  }

  /**
   * Append one element to an arena array.
   *
   * The span is re-pointed at a fresh arena array holding the old elements
   * followed by `value`. Existing elements keep their order. The previous
   * storage stays in the arena until the context dies.
   */
  template <typename T, typename U>
  void append(gsl::span<T> & arr, U value)
  {
    auto grown = allocate_array<T>(arr.size() + 1);
    std::copy(arr.begin(), arr.end(), grown.begin());
    grown[arr.size()] = value;
    arr = grown;
  }

private:
  /// Arena allocator - memory is freed only when destroyed
  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings - keys are string_views pointing to arena memory
  std::pmr::unordered_set<std::string_view> stringPool_;
};

}  // namespace apigen
