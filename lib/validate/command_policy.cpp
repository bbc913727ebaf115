// mathedit/validate/command_policy.cpp - Command allow-list and deny-list
#include "mathedit/validate/command_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace mathedit
{
namespace
{

std::string fold_case(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string_view strip_star(std::string_view name)
{
  if (name.size() > 1 && name.back() == '*') {
    name.remove_suffix(1);
  }
  return name;
}

}  // namespace

CommandPolicy::CommandPolicy(std::set<std::string> allow, std::set<std::string> deny)
: allow_(std::move(allow))
{
  for (auto & name : deny) {
    this->deny(name);
  }
}

const std::vector<std::string_view> & CommandPolicy::default_allow_list()
{
  static const std::vector<std::string_view> k_list = {
    // Math operations
    "frac", "dfrac", "tfrac", "cfrac", "binom", "dbinom", "tbinom", "sqrt", "root",
    "sum", "int", "iint", "iiint", "oint", "prod", "coprod", "lim", "limsup", "liminf", "inf",
    "sup", "max", "min", "arg", "det", "dim", "gcd", "deg", "ker", "Pr",
    // Functions
    "sin", "cos", "tan", "sec", "csc", "cot", "arcsin", "arccos", "arctan", "arcsec", "arccsc",
    "arccot", "sinh", "cosh", "tanh", "sech", "csch", "coth", "log", "ln", "exp", "lg",
    // Formatting
    "mathbf", "mathit", "mathrm", "mathsf", "mathtt", "mathcal", "mathbb", "mathfrak", "mathscr",
    "boldsymbol", "text", "textrm", "textnormal", "mbox", "operatorname", "textbf", "textit",
    "textsf", "texttt", "textsc", "emph", "underline", "overline", "tiny", "scriptsize",
    "footnotesize", "small", "normalsize", "large", "Large", "LARGE", "huge", "Huge",
    // Structures
    "begin", "end", "matrix", "pmatrix", "bmatrix", "Bmatrix", "vmatrix", "Vmatrix",
    "smallmatrix", "array", "cases", "align", "aligned", "eqnarray", "equation", "split",
    "multline", "gather", "gathered",
    // Operators and relations
    "partial", "nabla", "cdot", "times", "div", "pm", "mp", "ast", "star", "circ", "bullet",
    "leq", "geq", "le", "ge", "neq", "ne", "lt", "gt", "approx", "equiv", "sim", "simeq", "cong",
    "in", "notin", "ni", "subset", "supset", "subseteq", "supseteq", "cup", "cap", "setminus",
    "emptyset", "forall", "exists", "nexists", "land", "lor", "mid",
    "to", "rightarrow", "leftarrow", "Rightarrow", "Leftarrow", "leftrightarrow",
    "Leftrightarrow", "iff", "implies", "mapsto",
    // Greek letters
    "alpha", "beta", "gamma", "delta", "epsilon", "varepsilon", "zeta", "eta", "theta",
    "vartheta", "iota", "kappa", "lambda", "mu", "nu", "xi", "pi", "varpi", "rho", "varrho",
    "sigma", "varsigma", "tau", "upsilon", "phi", "varphi", "chi", "psi", "omega",
    "Gamma", "Delta", "Theta", "Lambda", "Xi", "Pi", "Sigma", "Upsilon", "Phi", "Psi", "Omega",
    // Symbols
    "infty", "varnothing", "ell", "hbar", "imath", "jmath", "aleph", "Re", "Im", "wp",
    // Spacing
    "quad", "qquad", "hspace", "vspace", "thinspace", "medspace", "thickspace", "negthinspace",
    "negmedspace", "negthickspace",
    // Delimiters
    "left", "right", "middle", "big", "Big", "bigg", "Bigg", "bigl", "bigr", "Bigl", "Bigr",
    "biggl", "biggr", "Biggl", "Biggr", "bigm", "Bigm", "langle", "rangle", "vert",
    // Accents
    "hat", "check", "breve", "acute", "grave", "tilde", "bar", "vec", "dot", "ddot", "dddot",
    "ddddot", "widehat", "widetilde", "overrightarrow",
    // Colors
    "color", "textcolor", "colorbox", "fcolorbox",
    // Other
    "label", "ref", "eqref", "tag", "not", "neg", "prime", "backprime", "ldots", "cdots", "vdots",
    "ddots", "angle", "measuredangle", "sphericalangle", "parallel", "nparallel", "perp",
    "propto", "asymp",
  };
  return k_list;
}

const std::vector<std::string_view> & CommandPolicy::default_deny_list()
{
  static const std::vector<std::string_view> k_list = {
    // File system and shell access
    "input", "include", "verbatiminput", "lstinputlisting", "write18", "openin", "openout",
    // Macro definition
    "def", "gdef", "edef", "xdef", "let", "newcommand", "renewcommand", "providecommand",
    "catcode", "makeatletter", "makeatother",
    // Package loading
    "usepackage", "RequirePackage", "documentclass",
    // Links can carry a javascript: target
    "href",
  };
  return k_list;
}

CommandPolicy CommandPolicy::defaults()
{
  CommandPolicy policy;
  for (std::string_view name : default_allow_list()) {
    policy.allow(std::string(name));
  }
  for (std::string_view name : default_deny_list()) {
    policy.deny(std::string(name));
  }
  return policy;
}

void CommandPolicy::allow(std::string name) { allow_.insert(std::move(name)); }

void CommandPolicy::deny(std::string name)
{
  deny_folded_.insert(fold_case(name));
  deny_.insert(std::move(name));
}

bool CommandPolicy::is_denied(std::string_view name) const
{
  return deny_folded_.count(fold_case(strip_star(name))) > 0;
}

bool CommandPolicy::is_allowed(std::string_view name) const
{
  if (is_denied(name)) {
    return false;
  }
  return allow_.count(std::string(strip_star(name))) > 0;
}

std::vector<std::string> CommandPolicy::overlap() const
{
  std::vector<std::string> out;
  for (const auto & name : allow_) {
    if (deny_folded_.count(fold_case(name)) > 0) {
      out.push_back(name);
    }
  }
  return out;
}

}  // namespace mathedit
