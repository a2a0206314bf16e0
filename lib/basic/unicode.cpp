// vfilter/basic/unicode.cpp - UTF-8 helpers
#include "vfilter/basic/unicode.hpp"

#include <unicode/uchar.h>

namespace vfilter
{
DecodedChar decode_utf8(std::string_view s, size_t offset) noexcept
{
  if (offset >= s.size()) {
    return {k_invalid_code_point, 0};
  }

  const auto b0 = static_cast<unsigned char>(s[offset]);
  if (b0 < 0x80) {
    return {static_cast<char32_t>(b0), 1};
  }

  size_t len = 0;
  char32_t cp = 0;
  if ((b0 & 0xE0) == 0xC0) {
    len = 2;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    len = 3;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    len = 4;
    cp = b0 & 0x07;
  } else {
    return {k_invalid_code_point, 1};
  }

  if (offset + len > s.size()) {
    return {k_invalid_code_point, 1};
  }
  for (size_t i = 1; i < len; ++i) {
    const auto b = static_cast<unsigned char>(s[offset + i]);
    if ((b & 0xC0) != 0x80) {
      return {k_invalid_code_point, 1};
    }
    cp = (cp << 6) | (b & 0x3F);
  }

  // Reject overlong forms and values past the Unicode range
  if (
    (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
    cp > 0x10FFFF) {
    return {k_invalid_code_point, 1};
  }
  return {cp, len};
}

void append_utf8(std::string & out, char32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

// Letters are General Category L*. Combining marks (M*) are not.
bool is_letter(char32_t cp) noexcept
{
  if (cp < 0x80) {
    return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  if (cp > 0x10FFFF) {
    return false;
  }
  return u_isalpha(static_cast<UChar32>(cp)) != 0;
}

bool is_digit(char32_t cp) noexcept
{
  if (cp < 0x80) {
    return is_ascii_digit(cp);
  }
  if (cp > 0x10FFFF) {
    return false;
  }
  return u_isdigit(static_cast<UChar32>(cp)) != 0;
}

bool is_space(char32_t cp) noexcept
{
  if (cp > 0x10FFFF) {
    return false;
  }
  return u_isUWhiteSpace(static_cast<UChar32>(cp)) != 0;
}

}  // namespace vfilter
