// mathedit/tree/expr_context.hpp - Expression arena allocator and string pool
//
// ExprContext owns every node and interned string of an editing session.
// Uses std::pmr::monotonic_buffer_resource: nothing is freed individually,
// the whole arena goes away with the context.
//
#pragma once

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

#include "mathedit/tree/expr.hpp"

namespace mathedit
{

/**
 * Arena that owns expression nodes and interned strings.
 *
 * Nodes created through a context stay valid as long as the context is
 * alive. Trees from different versions of a formula share nodes, so a
 * context is only dropped once every root pointing into it is gone (see
 * SyncCoordinator compaction).
 *
 * Example:
 * @code
 *   ExprContext ctx;
 *   auto * a = ctx.create<LiteralExpr>(ctx.intern("a"));
 *   auto * b = ctx.create<LiteralExpr>(ctx.intern("b"));
 *   auto * frac = ctx.create<FractionExpr>(ctx.intern("frac"), ctx.list({a, b}));
 * @endcode
 */
class ExprContext
{
public:
  /// Default initial buffer size (16KB); formulas are small
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit ExprContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~ExprContext() = default;

  // PMR resources are not movable
  ExprContext(const ExprContext &) = delete;
  ExprContext & operator=(const ExprContext &) = delete;
  ExprContext(ExprContext &&) = delete;
  ExprContext & operator=(ExprContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a node of type T in the arena.
   *
   * @return Non-owning pointer, valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  const T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Expr, T>, "T must derive from Expr");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Expression nodes must be trivially destructible to live in the arena. "
      "Use std::string_view for text and ExprList for children.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    const T * const node = new (mem) T(std::forward<Args>(args)...);
    ++node_count_;
    return node;
  }

  /// Number of nodes ever created in this context (live or not)
  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that lives as long as the context.
   * Interning the same text twice returns the same pointer.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Child Lists
  // ===========================================================================

  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a child list into the arena.
  [[nodiscard]] ExprList list(const std::vector<const Expr *> & items)
  {
    auto span = allocate_array<const Expr *>(items.size());
    std::uninitialized_copy(items.begin(), items.end(), span.begin());
    return span;
  }

  [[nodiscard]] ExprList list(std::initializer_list<const Expr *> items)
  {
    auto span = allocate_array<const Expr *>(items.size());
    std::uninitialized_copy(items.begin(), items.end(), span.begin());
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
  size_t node_count_ = 0;
};

}  // namespace mathedit
