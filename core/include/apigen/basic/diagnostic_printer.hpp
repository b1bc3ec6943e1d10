// apigen/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their location and notes in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "apigen/basic/diagnostic.hpp"

namespace apigen
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: unknown decorator 'to_xml'
 *     --> apigen.yaml: generator.decorators[1]
 *      |
 *      = note: not a registered decorator
 *      |
 *      = help: available decorators: object_to_json
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
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace apigen
