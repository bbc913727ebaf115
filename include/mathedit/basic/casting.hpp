// mathedit/basic/casting.hpp - LLVM-style RTTI casting for expression nodes
//
// Works with any hierarchy whose classes provide a static `classof`.
// Expression nodes dispatch on their ExprKind, so no virtual functions
// are involved.
//
// Usage:
//   if (isa<FractionExpr>(node)) { ... }
//   const auto * frac = cast<FractionExpr>(node);
//   if (const auto * big = dyn_cast<BigOpExpr>(node)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace mathedit
{

namespace detail
{

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

// ============================================================================
// isa<T>
// ============================================================================

/// True if `node` is non-null and of dynamic kind T
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/// True if `node` is any of the listed kinds
template <typename... Ts, typename From>
[[nodiscard]] inline bool isa_any(const From * node) noexcept
{
  return (isa<Ts>(node) || ...);
}

// ============================================================================
// cast<T> - kind is known; checked in debug builds only
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T> - nullptr when the kind does not match (or node is null)
// ============================================================================

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

}  // namespace mathedit
