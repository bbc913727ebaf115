// mathedit/validate/patterns.cpp - Disallowed-content detection and removal
#include "mathedit/validate/patterns.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace mathedit
{
namespace
{

// Backslash, then whatever the scanner skips before command letters
constexpr std::string_view k_command_prefix = R"(\\(?:\s|%[^\n]*)*)";

constexpr std::string_view k_file_access =
  "(?:input|include|verbatiminput|lstinputlisting|write18|openin|openout)\\b";
constexpr std::string_view k_macro_definition =
  "(?:def|gdef|edef|xdef|let|newcommand|renewcommand|providecommand|catcode|makeatletter|"
  "makeatother)\\b";
constexpr std::string_view k_package_loading = "(?:usepackage|requirepackage|documentclass)\\b";

constexpr std::string_view k_event_handler =
  "\\bon(?:error|load|unload|beforeunload|click|dblclick|contextmenu|mouse[a-z]*|pointer[a-z]*|"
  "key[a-z]*|focus|blur|change|input|submit|reset|select|abort|drag[a-z]*|drop|copy|cut|paste|"
  "scroll|resize|wheel|toggle|message|animation[a-z]*|transition[a-z]*|begin|end|repeat|play|"
  "pause)\\s*=";

constexpr std::string_view k_script_tag = R"(<\s*/?\s*script\b)";
constexpr std::string_view k_protocol = R"((?:javascript|vbscript)\s*:|data\s*:\s*text/html)";
constexpr std::string_view k_dangerous_tag =
  R"(<\s*/?\s*(?:iframe|object|embed|img|svg|style|link|meta|base|form|frame|frameset|applet)\b)";
constexpr std::string_view k_attribute_tag = R"(<\s*[a-z][a-z0-9-]*\s+[a-z-]+\s*=[^<>]*>)";

std::unique_ptr<re2::RE2> compile(const std::string & pattern)
{
  re2::RE2::Options options;
  options.set_case_sensitive(false);
  options.set_dot_nl(true);
  options.set_log_errors(false);
  auto regex = std::make_unique<re2::RE2>(pattern, options);
  if (!regex->ok()) {
    // Rules are compile-time constants; a bad one is a programming error
    throw std::logic_error("invalid content pattern '" + pattern + "': " + regex->error());
  }
  return regex;
}

std::string cat(std::initializer_list<std::string_view> parts)
{
  std::string out;
  for (std::string_view p : parts) {
    out += p;
  }
  return out;
}

}  // namespace

PatternSet::PatternSet()
{
  detect_.push_back({PatternClass::ScriptPayload, compile(cat({k_script_tag}))});
  detect_.push_back({PatternClass::ScriptPayload, compile(cat({k_event_handler}))});
  detect_.push_back({PatternClass::ProtocolScheme, compile(cat({k_protocol}))});
  detect_.push_back({PatternClass::FileAccess, compile(cat({k_command_prefix, k_file_access}))});
  detect_.push_back(
    {PatternClass::MacroDefinition, compile(cat({k_command_prefix, k_macro_definition}))});
  detect_.push_back(
    {PatternClass::PackageLoading, compile(cat({k_command_prefix, k_package_loading}))});
  detect_.push_back({PatternClass::MarkupTag, compile(cat({k_dangerous_tag}))});
  detect_.push_back({PatternClass::MarkupTag, compile(cat({k_attribute_tag}))});

  // Whole script elements first, so their content goes too
  rewrite_.push_back({compile(R"(<\s*script\b.*?<\s*/\s*script\s*>)"), ""});
  rewrite_.push_back({compile(cat({k_script_tag, "[^>]*>?"})), ""});
  rewrite_.push_back(
    {compile(cat({k_event_handler, R"(\s*(?:"[^"]*"|'[^']*'|[^\s>]*))"})), ""});
  rewrite_.push_back({compile(cat({k_protocol})), ""});

  // A removed command leaves an empty group so its parent keeps a fillable slot
  const std::string argument = R"(\s*(?:\{[^{}]*\})?)";
  for (std::string_view names : {k_file_access, k_macro_definition, k_package_loading}) {
    rewrite_.push_back({compile(cat({k_command_prefix, names, argument})), "{}"});
  }

  rewrite_.push_back({compile(cat({k_dangerous_tag, "[^>]*>?"})), ""});
  rewrite_.push_back({compile(cat({k_attribute_tag})), ""});
}

PatternSet::~PatternSet() = default;

const PatternSet & PatternSet::builtin()
{
  static const PatternSet k_instance;
  return k_instance;
}

std::vector<PatternMatch> PatternSet::find(std::string_view markup) const
{
  std::vector<PatternMatch> out;
  const re2::StringPiece text(markup.data(), markup.size());

  for (const Rule & rule : detect_) {
    const bool seen = std::any_of(out.begin(), out.end(), [&](const PatternMatch & m) {
      return m.pattern_class == rule.pattern_class;
    });
    if (seen) {
      continue;
    }

    re2::StringPiece hit;
    if (!rule.regex->Match(text, 0, text.size(), re2::RE2::UNANCHORED, &hit, 1)) {
      continue;
    }
    const auto begin = static_cast<uint32_t>(hit.data() - markup.data());
    out.push_back(PatternMatch{
      rule.pattern_class, SourceRange(begin, begin + static_cast<uint32_t>(hit.size())),
      std::string(hit.data(), hit.size())});
  }

  std::stable_sort(out.begin(), out.end(), [](const PatternMatch & a, const PatternMatch & b) {
    return a.pattern_class < b.pattern_class;
  });
  return out;
}

bool PatternSet::matches_any(std::string_view markup) const
{
  const re2::StringPiece text(markup.data(), markup.size());
  return std::any_of(detect_.begin(), detect_.end(), [&](const Rule & rule) {
    return re2::RE2::PartialMatch(text, *rule.regex);
  });
}

std::string PatternSet::sanitize(std::string_view markup) const
{
  std::string current(markup);
  // Every rewrite shortens the text, so this reaches a fixed point
  while (true) {
    std::string next = current;
    for (const Rewrite & rw : rewrite_) {
      re2::RE2::GlobalReplace(&next, *rw.regex, rw.replacement);
    }
    if (next == current) {
      return current;
    }
    current = std::move(next);
  }
}

}  // namespace mathedit
