// mathedit/tree/node_kind.hpp - Expression node kind enumeration
#pragma once

#include <cstdint>
#include <string_view>

namespace mathedit
{

/**
 * Closed set of expression node kinds, generated from expr_nodes.def.
 * Kinds are grouped by category so classof checks are range comparisons.
 */
enum class ExprKind : uint8_t {
// === Leaves ===
#define EXPR_NODE_LEAF(Class, Kind, Snake) Kind,
#include "mathedit/tree/expr_nodes.def"

// === Structures ===
#define EXPR_NODE_STRUCT(Class, Kind, Snake) Kind,
#include "mathedit/tree/expr_nodes.def"

// === Big operators ===
#define EXPR_NODE_BIG_OP(Class, Kind, Snake) Kind,
#include "mathedit/tree/expr_nodes.def"
};

[[nodiscard]] constexpr std::string_view to_string(ExprKind k) noexcept
{
  switch (k) {
#define EXPR_NODE_LEAF(Class, Kind, Snake) \
  case ExprKind::Kind:                     \
    return #Kind;
#define EXPR_NODE_STRUCT(Class, Kind, Snake) \
  case ExprKind::Kind:                       \
    return #Kind;
#define EXPR_NODE_BIG_OP(Class, Kind, Snake) \
  case ExprKind::Kind:                       \
    return #Kind;
#include "mathedit/tree/expr_nodes.def"
  }
  return "<unknown>";
}

namespace detail
{

inline constexpr ExprKind k_first_leaf_kind = ExprKind::Literal;
inline constexpr ExprKind k_last_leaf_kind = ExprKind::Placeholder;

inline constexpr ExprKind k_first_struct_kind = ExprKind::Fraction;
inline constexpr ExprKind k_last_struct_kind = ExprKind::Sequence;

inline constexpr ExprKind k_first_big_op_kind = ExprKind::Integral;
inline constexpr ExprKind k_last_big_op_kind = ExprKind::Limit;

}  // namespace detail

[[nodiscard]] constexpr bool is_leaf_kind(ExprKind kind) noexcept
{
  return kind >= detail::k_first_leaf_kind && kind <= detail::k_last_leaf_kind;
}

[[nodiscard]] constexpr bool is_struct_kind(ExprKind kind) noexcept
{
  return kind >= detail::k_first_struct_kind && kind <= detail::k_last_struct_kind;
}

[[nodiscard]] constexpr bool is_big_op_kind(ExprKind kind) noexcept
{
  return kind >= detail::k_first_big_op_kind && kind <= detail::k_last_big_op_kind;
}

/// Kinds that do not add a level of structural depth
[[nodiscard]] constexpr bool is_transparent_kind(ExprKind kind) noexcept
{
  return kind == ExprKind::Sequence || kind == ExprKind::Literal;
}

}  // namespace mathedit
