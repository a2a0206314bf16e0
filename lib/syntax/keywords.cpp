// vfilter/syntax/keywords.cpp
#include "vfilter/syntax/keywords.hpp"

#include <algorithm>
#include <cctype>

#include "vfilter/basic/unicode.hpp"

namespace vfilter::syntax
{
namespace
{

[[nodiscard]] bool iequals_ascii(std::string_view a, std::string_view b) noexcept
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

TokenKind kind_of(std::string_view word) noexcept
{
  for (const auto & kw : k_keywords) {
    if (iequals_ascii(word, kw.spelling)) {
      return kw.kind;
    }
  }
  return TokenKind::Ident;
}

bool is_keyword(std::string_view word) noexcept { return kind_of(word) != TokenKind::Ident; }

bool is_literal_char(char32_t cp) noexcept { return cp == '_' || is_letter(cp) || is_digit(cp); }

bool is_identifier(std::string_view word) noexcept
{
  if (word.empty() || is_keyword(word)) {
    return false;
  }
  size_t offset = 0;
  while (offset < word.size()) {
    const DecodedChar ch = decode_utf8(word, offset);
    if (!is_literal_char(ch.cp)) {
      return false;
    }
    offset += ch.length;
  }
  return true;
}

}  // namespace vfilter::syntax
