// vfilter/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "vfilter/basic/diagnostic.hpp"
#include "vfilter/basic/source_manager.hpp"

namespace vfilter
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error: expected ')' but found end of input
 *     --> <input>:1:8
 *         |
 *       1 | (a == 1
 *         |        ^ expected `)`
 *       1 | (a == 1
 *         | - to match this '('
 *         |
 *   help: add ')' here
 *         |
 *       1 | (a == 1)
 *         |        +
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
   * Print a single diagnostic with snippets taken from `source`.
   */
  void print(const Diagnostic & diag, const SourceManager & source);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by position.
   */
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  enum class Marker { Primary, Related };

  void print_header(const Diagnostic & diag);
  void print_snippet(
    SourceRange range, std::string_view caption, Marker marker, const SourceManager & source);
  void print_insertion(const Insertion & insertion, const SourceManager & source);
  void print_trailer(std::string_view kind, std::string_view message);
  void print_numbered_line(uint32_t line_num, std::string_view text);

  /// Gutter text, cyan when colour is on.
  void gutter(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace vfilter
