// hammer/report/report_printer.hpp
//
// Renders a merged bundle either as JSON or as annotated terminal text with
// source excerpts and position markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "hammer/basic/bundle.hpp"
#include "hammer/basic/report.hpp"
#include "hammer/basic/source_file.hpp"

namespace hammer
{

/**
 * Prints reports in a Rust-like format.
 *
 * Produces output like:
 *   When evaluating attribute ‘hello’:
 *   warning: unused-dependency
 *   ‘gettext’ is listed in buildInputs but never used.
 *     --> pkgs/hello/default.nix:12:5
 *         |
 *      12 |   buildInputs = [ gettext ];
 *         |     ^
 *         |
 *         = see: https://github.com/jtojnar/nixpkgs-hammering/blob/master/explanations/unused-dependency.md
 */
class ReportPrinter
{
public:
  /**
   * Create a report printer.
   *
   * @param os Output stream
   * @param use_color Whether to emit terminal colors
   */
  explicit ReportPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print the reports of one attribute.
   *
   * @throws RenderError if a location's file or line does not exist
   */
  void print(const std::string & attr, const std::vector<Diagnostic> & diags);

  /**
   * Print every attribute of a bundle, in bundle order.
   */
  void print_all(const DiagnosticBundle & bundle);

private:
  void print_attribute_header(std::string_view attr);
  void print_severity_header(const Diagnostic & diag);
  void print_message(std::string_view message);
  void print_location(const SourceLocation & location);
  void print_source_line(const SourceFile & source, uint32_t line, uint32_t column);
  void print_link(std::string_view url);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
  SourceCache sources_;
};

/**
 * Print a bundle as one pretty-printed JSON object followed by a newline.
 */
void print_json(std::ostream & os, const DiagnosticBundle & bundle);

}  // namespace hammer
