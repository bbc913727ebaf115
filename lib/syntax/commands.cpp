// mathedit/syntax/commands.cpp - Command table lookup
#include "mathedit/syntax/commands.hpp"

#include <algorithm>

namespace mathedit::syntax
{
namespace
{

template <size_t N>
bool contains(const std::array<std::string_view, N> & table, std::string_view name) noexcept
{
  return std::any_of(
    table.begin(), table.end(), [&](std::string_view entry) { return entry == name; });
}

}  // namespace

ExprKind big_operator_kind(std::string_view name) noexcept
{
  if (contains(k_sum_commands, name)) return ExprKind::Sum;
  if (contains(k_product_commands, name)) return ExprKind::Product;
  if (contains(k_limit_commands, name)) return ExprKind::Limit;
  return ExprKind::Integral;
}

CommandClass classify_command(std::string_view name) noexcept
{
  if (contains(k_fraction_commands, name)) return CommandClass::Fraction;
  if (name == "sqrt") return CommandClass::Root;
  if (
    contains(k_integral_commands, name) || contains(k_sum_commands, name) ||
    contains(k_product_commands, name) || contains(k_limit_commands, name)) {
    return CommandClass::BigOperator;
  }
  if (contains(k_text_commands, name)) return CommandClass::Text;
  if (contains(k_format_commands, name)) return CommandClass::Format;
  if (contains(k_colored_format_commands, name)) return CommandClass::ColoredFormat;
  if (contains(k_symbol_commands, name)) return CommandClass::Symbol;
  if (contains(k_operator_commands, name)) return CommandClass::Operator;
  if (contains(k_delimiter_commands, name)) return CommandClass::Delimiter;
  return CommandClass::Function;
}

bool is_known_command(std::string_view name) noexcept
{
  return classify_command(name) != CommandClass::Function;
}

}  // namespace mathedit::syntax
