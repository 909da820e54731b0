// nestgeom/basic/diagnostic_printer.hpp
//
// Prints diagnostics in a compact Rust-style format:
//
//   error[E002]: cell 'fuel' is not defined in the system
//     --> tally 'pin_flux'
//      = help: add the cell to the 'system.cells' table
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "nestgeom/basic/diagnostic.hpp"

namespace nestgeom
{

class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_context(std::string_view context);
  void print_help(std::string_view message);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace nestgeom
