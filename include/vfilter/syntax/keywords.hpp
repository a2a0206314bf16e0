// vfilter/syntax/keywords.hpp - Keyword table and identifier rules
#pragma once

#include <array>
#include <string_view>

#include "vfilter/syntax/token.hpp"

namespace vfilter::syntax
{

struct KeywordEntry
{
  std::string_view spelling;
  TokenKind kind;
};

/// Reserved words, in canonical (lower-case) spelling.
inline constexpr std::array<KeywordEntry, 7> k_keywords = {{
  {"true", TokenKind::True},
  {"false", TokenKind::False},
  {"and", TokenKind::And},
  {"or", TokenKind::Or},
  {"not", TokenKind::Not},
  {"in", TokenKind::In},
  {"like", TokenKind::Like},
}};

/// Keyword kind of `word` (case-insensitive), or TokenKind::Ident.
[[nodiscard]] TokenKind kind_of(std::string_view word) noexcept;

[[nodiscard]] bool is_keyword(std::string_view word) noexcept;

/// Letter, digit or '_'.
[[nodiscard]] bool is_literal_char(char32_t cp) noexcept;

/// Non-empty, not a keyword, and made of literal characters only.
[[nodiscard]] bool is_identifier(std::string_view word) noexcept;

}  // namespace vfilter::syntax
