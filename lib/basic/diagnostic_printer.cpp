// mathedit/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "mathedit/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace mathedit
{

namespace
{

constexpr std::string_view k_margin = "      ";

std::string expand_tabs(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os)
{
  if (!use_color) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  const FullSourceRange primary = source.get_full_range(diag.primary_range());
  gutter("  -->");
  if (primary.is_valid()) {
    fmt::print(os_, " {}:{}:{}\n", source.get_name(), primary.start_line, primary.start_column);
  } else {
    fmt::print(os_, " {}\n", source.get_name());
  }
  blank_gutter_line();

  for (const auto & label : diag.labels) {
    print_label(label, source);
  }
  for (const auto & fixit : diag.fixits) {
    print_fixit(fixit, source);
  }
  if (diag.help_message) {
    print_footer("help", *diag.help_message);
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> ordered(diags.begin(), diags.end());
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });

  for (const auto & d : ordered) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const bool error = diag.severity == Severity::Error;
  std::string head = error ? "error" : "warning";
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }

  os_ << rang::style::bold << (error ? rang::fg::red : rang::fg::yellow) << head << rang::fg::reset
      << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label(const Label & label, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!label.range.is_valid() || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_footer("note", label.message);
    }
    return;
  }

  const std::string_view line = source.get_line(fr.start_line - 1);
  if (line.empty()) {
    return;
  }
  print_numbered_line(fr.start_line, expand_tabs(line));

  // Single-line spans are underlined in full, anything else gets one marker
  const uint32_t width = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                           ? fr.end_column - fr.start_column
                           : 1;
  const size_t indent =
    expand_tabs(line.substr(0, std::min<size_t>(fr.start_column - 1, line.size()))).size();
  const bool primary = label.style == LabelStyle::Primary;

  gutter(std::string(k_margin) + "|");
  os_ << " " << std::string(indent, ' ');
  if (primary) {
    os_ << rang::fg::red << rang::style::bold;
  } else {
    os_ << rang::fg::cyan;
  }
  os_ << std::string(width, primary ? '^' : '-');
  if (!label.message.empty()) {
    os_ << " " << label.message;
  }
  os_ << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(fixit.range);
  if (!fr.is_valid()) {
    return;
  }

  print_footer("help", fmt::format("add '{}' here", fixit.replacement_text));

  // Splice the replacement into the line at the fix-it column
  const std::string_view line = source.get_line(fr.start_line - 1);
  const size_t insert_at = std::min<size_t>(fr.start_column - 1, line.size());
  const std::string before = expand_tabs(line.substr(0, insert_at));
  print_numbered_line(
    fr.start_line, before + fixit.replacement_text + expand_tabs(line.substr(insert_at)));

  gutter(std::string(k_margin) + "|");
  os_ << " " << std::string(before.size(), ' ') << rang::fg::green << rang::style::bold
      << std::string(std::max<size_t>(fixit.replacement_text.size(), 1), '+')
      << rang::style::reset << rang::fg::reset << "\n";
}

void DiagnosticPrinter::print_footer(std::string_view title, std::string_view message)
{
  blank_gutter_line();
  gutter("   =");
  fmt::print(os_, " {}: {}\n", title, message);
}

void DiagnosticPrinter::print_numbered_line(uint32_t line_number, std::string_view text)
{
  gutter(fmt::format(" {:>4} |", line_number));
  fmt::print(os_, " {}\n", text);
}

void DiagnosticPrinter::blank_gutter_line()
{
  gutter(std::string(k_margin) + "|");
  os_ << "\n";
}

void DiagnosticPrinter::gutter(std::string_view text)
{
  os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
}

}  // namespace mathedit
