// mathedit/validate/command_policy.hpp - Command allow-list and deny-list
#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mathedit
{

/**
 * Which command and environment names a formula may use.
 *
 * A name is accepted when it is in the allow-list and not in the
 * deny-list. The deny-list is matched case-insensitively (so `\INPUT` is
 * still denied); the allow-list is matched exactly, since `\Delta` and
 * `\delta` are different symbols. A trailing `*` on an environment name
 * (`align*`) is ignored.
 */
class CommandPolicy
{
public:
  /// Empty policy: nothing is allowed
  CommandPolicy() = default;

  CommandPolicy(std::set<std::string> allow, std::set<std::string> deny);

  /// Built-in lists
  [[nodiscard]] static CommandPolicy defaults();
  [[nodiscard]] static const std::vector<std::string_view> & default_allow_list();
  [[nodiscard]] static const std::vector<std::string_view> & default_deny_list();

  void allow(std::string name);
  void deny(std::string name);

  [[nodiscard]] bool is_allowed(std::string_view name) const;
  [[nodiscard]] bool is_denied(std::string_view name) const;

  /// Names that appear in both lists (compared case-insensitively)
  [[nodiscard]] std::vector<std::string> overlap() const;

  [[nodiscard]] const std::set<std::string> & allow_set() const noexcept { return allow_; }
  [[nodiscard]] const std::set<std::string> & deny_set() const noexcept { return deny_; }

private:
  std::set<std::string> allow_;
  std::set<std::string> deny_;
  std::set<std::string> deny_folded_;  // lower-cased deny_
};

}  // namespace mathedit
