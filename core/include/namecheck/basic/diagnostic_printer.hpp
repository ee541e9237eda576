// namecheck/basic/diagnostic_printer.hpp
//
// Prints diagnostics with location, the offending source line when the
// file is readable, and note/help lines in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "namecheck/basic/diagnostic.hpp"

namespace namecheck
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[N003]: name 'getHTTPCode' should follow camelCase
 *     --> src/Parser.java:12:17
 *      |
 *   12 |     public int getHTTPCode() {
 *      |                ^^^^^^^^^^^
 *      |
 *      = note: method declared in class 'Parser'
 *      = help: use lowerCamelCase with no two capitals in a row, e.g. 'parseUrl'
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   * @param show_source Whether to read source files to show the offending line
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true, bool show_source = true);

  /// Print a single diagnostic.
  void print(const Diagnostic & diag);

  /// Print all diagnostics of a bag, in the order they were reported.
  void print_all(const DiagnosticBag & diags);

  /// Print the "N warnings emitted" trailer.
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(const SourceLocation & loc, std::string_view name);

  void print_note(std::string_view message);
  void print_help(std::string_view message);

  /// Line `line` (1-based) of `file`, or nullptr if unavailable.
  const std::string * source_line(std::string_view file, uint32_t line);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
  bool show_source_;

  /// Lines of files read so far (empty vector if unreadable).
  std::unordered_map<std::string, std::vector<std::string>> fileLines_;
};

}  // namespace namecheck
