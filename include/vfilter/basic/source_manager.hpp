// vfilter/basic/source_manager.hpp - Source positions and line lookup
//
// Positions are (line, column) pairs, both 1-based. The sentinel
// k_no_position = (0, 0) marks synthetic nodes and collapsed token ends.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vfilter
{

// ============================================================================
// Position
// ============================================================================

/**
 * A location in the filter text.
 *
 * Columns count code points, not bytes, so a diagnostic caret lines up
 * with what the user typed.
 */
struct Position
{
  uint32_t line = 0;
  uint32_t column = 0;

  constexpr Position() noexcept = default;
  constexpr Position(uint32_t l, uint32_t c) noexcept : line(l), column(c) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0; }

  /// Renders "L:C" ("0:0" for the sentinel).
  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(Position a, Position b) noexcept
  {
    return a.line == b.line && a.column == b.column;
  }
  friend constexpr bool operator!=(Position a, Position b) noexcept { return !(a == b); }
  friend constexpr bool operator<(Position a, Position b) noexcept
  {
    return a.line < b.line || (a.line == b.line && a.column < b.column);
  }
  friend constexpr bool operator<=(Position a, Position b) noexcept { return !(b < a); }
  friend constexpr bool operator>(Position a, Position b) noexcept { return b < a; }
  friend constexpr bool operator>=(Position a, Position b) noexcept { return !(a < b); }
};

inline constexpr Position k_no_position{};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Inclusive range [begin, end] of positions.
 *
 * A range is valid when its begin is valid. An invalid end means the range
 * collapses to its begin (error tokens are built this way).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(Position begin, Position end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr Position get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr Position get_end() const noexcept
  {
    return end_.is_valid() ? end_ : begin_;
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return begin_.is_valid(); }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

private:
  Position begin_;
  Position end_;
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Owns the filter text and a line table for snippet rendering.
 */
class SourceManager
{
public:
  SourceManager() = default;
  explicit SourceManager(std::string text, std::string name = "<input>");

  [[nodiscard]] std::string_view get_text() const noexcept { return text_; }
  [[nodiscard]] const std::string & get_name() const noexcept { return name_; }

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Line content without its terminator; `line` is 1-based. Empty when out of range.
  [[nodiscard]] std::string_view get_line(uint32_t line) const noexcept;

private:
  void compute_line_offsets();

  std::string text_;
  std::string name_;
  std::vector<size_t> line_offsets_;
};

}  // namespace vfilter
