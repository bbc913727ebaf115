// mathedit/basic/diagnostic_printer.hpp
//
// Prints diagnostics with markup context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/basic/source_manager.hpp"

namespace mathedit
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: unclosed group
 *     --> <input>:1:7
 *      |
 *    1 | \frac{a{b}
 *      |       ^ opened here
 *      |
 *      = help: add '}' to close the group
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic against the markup it was reported on.
   */
  void print(const Diagnostic & diag, const SourceManager & source);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by position.
   */
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceManager & source);
  void print_fixit(const FixIt & fixit, const SourceManager & source);
  void print_footer(std::string_view title, std::string_view message);
  void print_numbered_line(uint32_t line_number, std::string_view text);
  void blank_gutter_line();
  void gutter(std::string_view text);

  std::ostream & os_;
};

}  // namespace mathedit
