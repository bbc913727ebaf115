// mathedit/syntax/commands.hpp - Command table: how each known command parses
#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "mathedit/tree/node_kind.hpp"

namespace mathedit::syntax
{

enum class CommandClass : uint8_t {
  Fraction,       // \frac{num}{den}
  Root,           // \sqrt[index]{radicand}
  BigOperator,    // \int_a^b x, \sum, \prod, \lim
  Text,           // \text{verbatim}
  Format,         // \mathbf{body}
  ColoredFormat,  // \textcolor{red}{body}
  Symbol,         // \alpha -> Variable
  Operator,       // \cdot -> Operator
  Delimiter,      // \left( -> Operator
  Function,       // \sin, and every unknown command
};

[[nodiscard]] constexpr std::string_view to_string(CommandClass c) noexcept
{
  switch (c) {
    case CommandClass::Fraction:
      return "fraction";
    case CommandClass::Root:
      return "root";
    case CommandClass::BigOperator:
      return "big operator";
    case CommandClass::Text:
      return "text";
    case CommandClass::Format:
      return "format";
    case CommandClass::ColoredFormat:
      return "colored format";
    case CommandClass::Symbol:
      return "symbol";
    case CommandClass::Operator:
      return "operator";
    case CommandClass::Delimiter:
      return "delimiter";
    case CommandClass::Function:
      return "function";
  }
  return "<unknown>";
}

// ============================================================================
// Tables
// ============================================================================

inline constexpr std::array<std::string_view, 7> k_fraction_commands = {
  "frac", "dfrac", "tfrac", "cfrac", "binom", "dbinom", "tbinom",
};

inline constexpr std::array<std::string_view, 4> k_integral_commands = {
  "int", "iint", "iiint", "oint",
};
inline constexpr std::array<std::string_view, 1> k_sum_commands = {"sum"};
inline constexpr std::array<std::string_view, 2> k_product_commands = {"prod", "coprod"};
inline constexpr std::array<std::string_view, 3> k_limit_commands = {"lim", "limsup", "liminf"};

inline constexpr std::array<std::string_view, 5> k_text_commands = {
  "text", "textrm", "mbox", "textnormal", "operatorname",
};

inline constexpr std::array<std::string_view, 41> k_format_commands = {
  // fonts
  "mathbf", "mathit", "mathrm", "mathsf", "mathtt", "mathcal", "mathbb", "mathfrak", "mathscr",
  "boldsymbol", "textbf", "textit", "textsf", "texttt", "textsc", "emph", "underline", "overline",
  // accents
  "hat", "check", "breve", "acute", "grave", "tilde", "bar", "vec", "dot", "ddot", "widehat",
  "widetilde", "overrightarrow",
  // sizes
  "tiny", "scriptsize", "footnotesize", "small", "normalsize", "large", "Large", "LARGE", "huge",
  "Huge",
};

inline constexpr std::array<std::string_view, 2> k_colored_format_commands = {
  "textcolor", "colorbox",
};

inline constexpr std::array<std::string_view, 58> k_symbol_commands = {
  "alpha", "beta", "gamma", "delta", "epsilon", "varepsilon", "zeta", "eta", "theta", "vartheta",
  "iota", "kappa", "lambda", "mu", "nu", "xi", "pi", "varpi", "rho", "varrho", "sigma",
  "varsigma", "tau", "upsilon", "phi", "varphi", "chi", "psi", "omega",
  "Gamma", "Delta", "Theta", "Lambda", "Xi", "Pi", "Sigma", "Upsilon", "Phi", "Psi", "Omega",
  "infty", "partial", "nabla", "ell", "hbar", "imath", "jmath", "emptyset", "varnothing",
  "aleph", "prime", "backprime", "angle", "measuredangle", "sphericalangle", "Re", "Im", "wp",
};

inline constexpr std::array<std::string_view, 70> k_operator_commands = {
  "cdot", "times", "div", "pm", "mp", "ast", "star", "circ", "bullet",
  "leq", "geq", "le", "ge", "neq", "ne", "lt", "gt", "approx", "equiv", "sim", "simeq", "cong",
  "propto", "asymp", "parallel", "nparallel", "perp", "mid",
  "in", "notin", "ni", "subset", "supset", "subseteq", "supseteq", "cup", "cap", "setminus",
  "forall", "exists", "nexists", "not", "neg", "land", "lor",
  "to", "rightarrow", "leftarrow", "Rightarrow", "Leftarrow", "leftrightarrow", "Leftrightarrow",
  "iff", "implies", "mapsto",
  "quad", "qquad", "thinspace", "medspace", "thickspace", "negthinspace", "negmedspace",
  "negthickspace",
  "ldots", "cdots", "vdots", "ddots",
  "langle", "rangle", "vert",
};

inline constexpr std::array<std::string_view, 17> k_delimiter_commands = {
  "left", "right", "middle", "big", "Big", "bigg", "Bigg", "bigl", "bigr", "Bigl", "Bigr",
  "biggl", "biggr", "Biggl", "Biggr", "bigm", "Bigm",
};

// ============================================================================
// Lookup
// ============================================================================

/// How a command name parses; unknown names are Function
[[nodiscard]] CommandClass classify_command(std::string_view name) noexcept;

/// Node kind of a BigOperator command (Integral, Sum, Product or Limit)
[[nodiscard]] ExprKind big_operator_kind(std::string_view name) noexcept;

/// True if `name` appears in any table above
[[nodiscard]] bool is_known_command(std::string_view name) noexcept;

}  // namespace mathedit::syntax
