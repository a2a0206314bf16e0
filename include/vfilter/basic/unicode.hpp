// vfilter/basic/unicode.hpp - UTF-8 decoding and character classes
//
// Classification follows the Unicode General Category through ICU:
// letters are L*, digits are Nd, whitespace is the White_Space property.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace vfilter
{

/// Replacement character returned for malformed sequences.
inline constexpr char32_t k_invalid_code_point = 0xFFFD;

struct DecodedChar
{
  char32_t cp = k_invalid_code_point;
  size_t length = 0;  ///< Bytes consumed (0 only at end of input)
};

/**
 * Decode one UTF-8 sequence at `offset`.
 *
 * Malformed or truncated input yields k_invalid_code_point with a length of
 * one byte so callers always make progress.
 */
[[nodiscard]] DecodedChar decode_utf8(std::string_view s, size_t offset) noexcept;

/// Append the UTF-8 encoding of `cp` to `out`.
void append_utf8(std::string & out, char32_t cp);

[[nodiscard]] bool is_letter(char32_t cp) noexcept;
[[nodiscard]] bool is_digit(char32_t cp) noexcept;
[[nodiscard]] bool is_space(char32_t cp) noexcept;

[[nodiscard]] inline bool is_ascii_digit(char32_t cp) noexcept { return cp >= '0' && cp <= '9'; }

}  // namespace vfilter
