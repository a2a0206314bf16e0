// vfilter/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "vfilter/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

#include "vfilter/basic/unicode.hpp"

namespace vfilter
{
namespace
{

/// Expands tabs and drops line terminators so carets line up.
[[nodiscard]] std::string clean_line(std::string_view line)
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

/// Visual width of the code points before `column` (1-based).
[[nodiscard]] size_t visual_offset(std::string_view line, uint32_t column)
{
  size_t width = 0;
  size_t offset = 0;
  for (uint32_t col = 1; col < column && offset < line.size(); ++col) {
    const DecodedChar ch = decode_utf8(line, offset);
    width += (ch.cp == '\t') ? 4 : 1;
    offset += ch.length;
  }
  return width;
}

/// Byte offset of `column` (1-based) within `line`, clamped to its size.
[[nodiscard]] size_t byte_offset(std::string_view line, uint32_t column)
{
  size_t offset = 0;
  for (uint32_t col = 1; col < column && offset < line.size(); ++col) {
    offset += decode_utf8(line, offset).length;
  }
  return offset;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Force : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  gutter("  -->");
  if (diag.range.is_valid()) {
    fmt::print(os_, " {}:{}\n", source.get_name(), diag.range.get_begin().to_string());
  } else {
    fmt::print(os_, " {}\n", source.get_name());
  }
  gutter("      |");
  os_ << "\n";

  if (diag.range.is_valid()) {
    print_snippet(diag.range, diag.caption, Marker::Primary, source);
  } else if (!diag.caption.empty()) {
    print_trailer("note", diag.caption);
  }

  if (diag.related) {
    print_snippet(diag.related->range, diag.related->note, Marker::Related, source);
  }
  if (diag.insertion) {
    print_insertion(*diag.insertion, source);
  }
  if (diag.help) {
    print_trailer("help", *diag.help);
  }

  os_ << "\n";
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const Diagnostic & d : diags.all()) {
    ordered.push_back(&d);
  }

  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->range.get_begin() < b->range.get_begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, source);
  }
}

// =============================================================================
// Pieces
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string head(to_string(diag.severity));
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }

  if (use_color_) {
    os_ << rang::style::bold << (diag.is_error() ? rang::fg::red : rang::fg::yellow) << head
        << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}: {}\n", head, diag.message);
}

void DiagnosticPrinter::print_snippet(
  SourceRange range, std::string_view caption, Marker marker, const SourceManager & source)
{
  if (!range.is_valid()) {
    return;
  }

  const Position begin = range.get_begin();
  const Position end = range.get_end();
  const std::string_view line = source.get_line(begin.line);

  // Single-line ranges are underlined in full; anything else marks one column
  const size_t width = (end.line == begin.line && end.column >= begin.column)
                         ? static_cast<size_t>(end.column - begin.column + 1)
                         : 1;

  print_numbered_line(begin.line, clean_line(line));

  gutter("      |");
  os_ << " " << std::string(visual_offset(line, begin.column), ' ');
  if (use_color_) {
    if (marker == Marker::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  os_ << std::string(width, marker == Marker::Primary ? '^' : '-');
  if (!caption.empty()) {
    os_ << " " << caption;
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_insertion(const Insertion & insertion, const SourceManager & source)
{
  gutter("      |");
  os_ << "\n";
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "help";
  }
  fmt::print(os_, ": add '{}' here\n", insertion.text);

  const Position after = insertion.after;
  if (!after.is_valid()) {
    return;
  }

  const std::string_view line = source.get_line(after.line);
  const size_t split = byte_offset(line, after.column + 1);
  gutter("      |");
  os_ << "\n";
  print_numbered_line(
    after.line, clean_line(line.substr(0, split)) + insertion.text + clean_line(line.substr(split)));

  gutter("      |");
  os_ << " " << std::string(visual_offset(line, after.column + 1), ' ');
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << "+" << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "+";
  }
  os_ << "\n";
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  gutter("      |");
  os_ << "\n";
  gutter("   =");
  fmt::print(os_, " {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_numbered_line(uint32_t line_num, std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << fmt::format(" {:>4} ", line_num) << rang::fg::reset
        << rang::style::bold << "|" << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} |", line_num);
  }
  fmt::print(os_, " {}\n", text);
}

void DiagnosticPrinter::gutter(std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
    return;
  }
  os_ << text;
}

}  // namespace vfilter
