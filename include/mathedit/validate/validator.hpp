// mathedit/validate/validator.hpp - Complexity and security gate
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/basic/result.hpp"
#include "mathedit/basic/source_manager.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/validate/command_policy.hpp"
#include "mathedit/validate/limits.hpp"

namespace mathedit
{

struct ValidationError
{
  ErrorKind kind;
  std::string message;
  SourceRange range;    ///< invalid when the error concerns the whole formula
  std::string subject;  ///< offending command name or pattern class, if any
};

[[nodiscard]] Diagnostic to_diagnostic(const ValidationError & error);

using ValidationResult = Result<std::string, std::vector<ValidationError>>;

/**
 * Gate in front of every way markup enters the editor.
 *
 * Checks, each reported independently:
 *  1. length (TooLong; skips the structural checks),
 *  2. disallowed content patterns (UnsafeContent),
 *  3. command allow-list (DisallowedCommand, once per name),
 *  4. structural depth and parse errors (TooDeep, UnbalancedGroup, ArityMismatch),
 *  5. matrix dimensions (MatrixTooLarge).
 *
 * Stateless apart from its limits and policy.
 */
class Validator
{
public:
  Validator() : policy_(CommandPolicy::defaults()) {}
  Validator(Limits limits, CommandPolicy policy)
  : limits_(limits), policy_(std::move(policy))
  {
  }

  [[nodiscard]] const Limits & limits() const noexcept { return limits_; }
  [[nodiscard]] const CommandPolicy & policy() const noexcept { return policy_; }

  /// Sanitized markup when every check passes, otherwise all violations
  [[nodiscard]] ValidationResult validate(std::string_view markup) const;

  /// All violations; empty when the markup is acceptable
  [[nodiscard]] std::vector<ValidationError> inspect(std::string_view markup) const;

  /// Depth, matrix size and serialized length of a tree built by edits
  [[nodiscard]] std::vector<ValidationError> validate_tree(const Expr * root) const;

  /// TooLong when the markup exceeds max_length; run before building a tree from raw input
  [[nodiscard]] std::optional<ValidationError> check_length(std::string_view markup) const;

  /// Strip disallowed content until a fixed point; idempotent
  [[nodiscard]] static std::string sanitize(std::string_view markup);

private:
  void check_patterns(std::string_view markup, std::vector<ValidationError> & out) const;
  void check_commands(std::string_view markup, std::vector<ValidationError> & out) const;
  void check_structure(std::string_view markup, std::vector<ValidationError> & out) const;
  void check_tree(const Expr * root, std::vector<ValidationError> & out) const;

  Limits limits_;
  CommandPolicy policy_;
};

}  // namespace mathedit
