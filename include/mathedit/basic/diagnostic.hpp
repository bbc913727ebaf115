// mathedit/basic/diagnostic.hpp - Diagnostics for parsing, validation and editing
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mathedit/basic/source_manager.hpp"

namespace mathedit
{

// ============================================================================
// Error taxonomy
// ============================================================================

/**
 * Every failure the engine can report.
 *
 * Parse-time kinds are recoverable: the builder still returns a partial tree.
 * Validation-time kinds reject the offending input as a whole.
 */
enum class ErrorKind : uint8_t {
  // Parse-time
  UnbalancedGroup,
  ArityMismatch,
  // Validation-time
  TooLong,
  UnsafeContent,
  DisallowedCommand,
  TooDeep,
  MatrixTooLarge,
  // Editing
  InvalidPath,
  RenderFailure,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::UnbalancedGroup:
      return "UnbalancedGroup";
    case ErrorKind::ArityMismatch:
      return "ArityMismatch";
    case ErrorKind::TooLong:
      return "TooLong";
    case ErrorKind::UnsafeContent:
      return "UnsafeContent";
    case ErrorKind::DisallowedCommand:
      return "DisallowedCommand";
    case ErrorKind::TooDeep:
      return "TooDeep";
    case ErrorKind::MatrixTooLarge:
      return "MatrixTooLarge";
    case ErrorKind::InvalidPath:
      return "InvalidPath";
    case ErrorKind::RenderFailure:
      return "RenderFailure";
  }
  return "<unknown>";
}

/// Stable diagnostic code printed as error[CODE]
[[nodiscard]] constexpr std::string_view error_code(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::UnbalancedGroup:
      return "E0101";
    case ErrorKind::ArityMismatch:
      return "E0102";
    case ErrorKind::TooLong:
      return "E0201";
    case ErrorKind::UnsafeContent:
      return "E0202";
    case ErrorKind::DisallowedCommand:
      return "E0203";
    case ErrorKind::TooDeep:
      return "E0204";
    case ErrorKind::MatrixTooLarge:
      return "E0205";
    case ErrorKind::InvalidPath:
      return "E0301";
    case ErrorKind::RenderFailure:
      return "E0302";
  }
  return "";
}

[[nodiscard]] std::optional<ErrorKind> error_kind_from_code(std::string_view code) noexcept;

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
};

enum class LabelStyle {
  Primary,    // the direct cause
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "E0101"
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  /// Kind recovered from `code`, if the code is one of ours
  [[nodiscard]] std::optional<ErrorKind> kind() const noexcept { return error_kind_from_code(code); }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds its diagnostic to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report(
    ErrorKind kind, SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_kind(ErrorKind kind) const;

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);
  void clear() { diagnostics_.clear(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace mathedit
