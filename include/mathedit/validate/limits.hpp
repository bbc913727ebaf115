// mathedit/validate/limits.hpp - Complexity ceilings for one formula
#pragma once

#include <cstddef>
#include <cstdint>

namespace mathedit
{

struct Limits
{
  static constexpr size_t k_default_max_length = 10000;
  static constexpr uint32_t k_default_max_nesting_depth = 50;
  static constexpr uint32_t k_default_max_rows = 100;
  static constexpr uint32_t k_default_max_cols = 100;

  size_t max_length = k_default_max_length;  ///< bytes of markup
  uint32_t max_nesting_depth = k_default_max_nesting_depth;
  uint32_t max_rows = k_default_max_rows;
  uint32_t max_cols = k_default_max_cols;
};

}  // namespace mathedit
