// mathedit/validate/patterns.hpp - Disallowed-content detection and removal
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "mathedit/basic/source_manager.hpp"

namespace re2
{
class RE2;
}  // namespace re2

namespace mathedit
{

enum class PatternClass : uint8_t {
  ScriptPayload,    // <script>, inline event handlers
  ProtocolScheme,   // javascript:, vbscript:, data:text/html
  FileAccess,       // \input, \include, \write18, ...
  MacroDefinition,  // \def, \newcommand, \catcode, ...
  PackageLoading,   // \usepackage, \documentclass, ...
  MarkupTag,        // dangerous HTML tags, tags with attributes
};

[[nodiscard]] constexpr std::string_view to_string(PatternClass c) noexcept
{
  switch (c) {
    case PatternClass::ScriptPayload:
      return "ScriptPayload";
    case PatternClass::ProtocolScheme:
      return "ProtocolScheme";
    case PatternClass::FileAccess:
      return "FileAccess";
    case PatternClass::MacroDefinition:
      return "MacroDefinition";
    case PatternClass::PackageLoading:
      return "PackageLoading";
    case PatternClass::MarkupTag:
      return "MarkupTag";
  }
  return "<unknown>";
}

struct PatternMatch
{
  PatternClass pattern_class;
  SourceRange range;
  std::string text;
};

/**
 * Compiled RE2 rules for disallowed content.
 *
 * All rules are case-insensitive and tolerate whitespace and % comments
 * between a backslash and the command name, matching how the scanner
 * reads commands.
 */
class PatternSet
{
public:
  PatternSet();
  ~PatternSet();

  PatternSet(const PatternSet &) = delete;
  PatternSet & operator=(const PatternSet &) = delete;

  /// Shared instance; compiling the rules once is enough for a process
  [[nodiscard]] static const PatternSet & builtin();

  /// First match of each pattern class, in class order
  [[nodiscard]] std::vector<PatternMatch> find(std::string_view markup) const;

  [[nodiscard]] bool matches_any(std::string_view markup) const;

  /**
   * Remove or neutralize every match until nothing changes.
   *
   * Dangerous commands and their brace argument become `{}`; script
   * elements go with their content; other flagged tags, handlers and
   * protocol prefixes are deleted.
   */
  [[nodiscard]] std::string sanitize(std::string_view markup) const;

private:
  struct Rule
  {
    PatternClass pattern_class;
    std::unique_ptr<re2::RE2> regex;
  };

  struct Rewrite
  {
    std::unique_ptr<re2::RE2> regex;
    std::string replacement;
  };

  std::vector<Rule> detect_;
  std::vector<Rewrite> rewrite_;
};

}  // namespace mathedit
