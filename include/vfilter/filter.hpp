// vfilter/filter.hpp - Public entry points: parse, analyze, translate
//
// Typical use:
//
//   auto parsed = vfilter::parse_and_analyze("age > 18 and status == 'active'");
//   if (!parsed.ok()) { ... parsed.error()->message() ... }
//   auto result = vfilter::to_filter(parsed.root());
//
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/diagnostic.hpp"
#include "vfilter/basic/filter_error.hpp"
#include "vfilter/basic/source_manager.hpp"
#include "vfilter/qdrant/translator.hpp"
#include "vfilter/sema/analyzer.hpp"
#include "vfilter/syntax/parser.hpp"

namespace vfilter
{

struct ParseOptions
{
  syntax::ParserOptions parser;
  std::string source_name = "<input>";
};

class ParsedFilter;

/// Lex and parse `text`. On a syntax error root() is null and error() holds
/// a SyntaxError naming the first diagnostic.
[[nodiscard]] ParsedFilter parse(std::string_view text, const ParseOptions & options = {});

/// parse() followed by analyze(); an analyzer error is also added to the
/// diagnostics.
[[nodiscard]] ParsedFilter parse_and_analyze(
  std::string_view text, const ParseOptions & options = {});

/**
 * Result of parsing one filter text.
 *
 * Owns everything the tree refers to, so the root stays valid for the
 * lifetime of this object. Move-only.
 */
class ParsedFilter
{
public:
  ParsedFilter(std::string text, std::string source_name);

  ParsedFilter(const ParsedFilter &) = delete;
  ParsedFilter & operator=(const ParsedFilter &) = delete;
  ParsedFilter(ParsedFilter &&) = default;
  ParsedFilter & operator=(ParsedFilter &&) = default;
  ~ParsedFilter() = default;

  [[nodiscard]] const Expr * root() const noexcept { return root_; }
  [[nodiscard]] AstContext & context() noexcept { return *ctx_; }
  [[nodiscard]] const SourceManager & source() const noexcept { return *source_; }
  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diags_; }
  [[nodiscard]] const std::optional<FilterError> & error() const noexcept { return error_; }
  [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }

private:
  friend ParsedFilter parse(std::string_view text, const ParseOptions & options);
  friend ParsedFilter parse_and_analyze(std::string_view text, const ParseOptions & options);

  std::unique_ptr<AstContext> ctx_;
  std::unique_ptr<SourceManager> source_;
  DiagnosticBag diags_;
  Expr * root_ = nullptr;
  std::optional<FilterError> error_;
};

/// Analyze `expr` and, when it is accepted, translate it. A rejected tree
/// yields an empty filter together with the analyzer's error.
[[nodiscard]] qdrant::TranslateResult to_filter(const Expr * expr);

/// Re-report a core error as a diagnostic with code "E<n>" at its position.
void to_diagnostic(const FilterError & err, DiagnosticBag & diags);

}  // namespace vfilter
