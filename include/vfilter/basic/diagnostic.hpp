// vfilter/basic/diagnostic.hpp - Problems found while reading a filter
//
// The parser reports syntax errors (with the unmatched opener and the text
// that would repair the input) and warnings for odd string escapes. Semantic
// errors are re-reported through to_diagnostic() with their E0nn code.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vfilter/basic/source_manager.hpp"

namespace vfilter
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

[[nodiscard]] std::string_view to_string(Severity s) noexcept;

/// A second location shown below the primary one, e.g. the '(' left open.
struct RelatedSpan
{
  SourceRange range;
  std::string note;
};

/// Text that repairs the input when inserted right after `after`.
struct Insertion
{
  Position after;
  std::string text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     ///< "E0nn" for filter errors; empty for syntax errors
  std::string message;
  SourceRange range;    ///< Invalid for errors that have no location
  std::string caption;  ///< Printed beside the caret run

  std::optional<RelatedSpan> related;
  std::optional<Insertion> insertion;
  std::optional<std::string> help;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  Diagnostic & with_code(std::string c);
  Diagnostic & with_related(SourceRange r, std::string note);
  Diagnostic & insert_after(Position after, std::string text);
  Diagnostic & with_help(std::string text);
};

/**
 * Ordered list of diagnostics for one input.
 *
 * error() and warning() append and return the new entry so callers can
 * decorate it in the same expression. The reference is invalidated by the
 * next append.
 */
class DiagnosticBag
{
public:
  Diagnostic & error(SourceRange range, std::string message, std::string caption = {});
  Diagnostic & warning(SourceRange range, std::string message, std::string caption = {});

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return items_; }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return items_.size(); }

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }
  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }

  /// First error in report order, or nullptr.
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

private:
  Diagnostic & push(Severity severity, SourceRange range, std::string message, std::string caption);

  std::vector<Diagnostic> items_;
  size_t error_count_ = 0;
};

}  // namespace vfilter
