// vfilter/filter.cpp - Public entry points
#include "vfilter/filter.hpp"

#include <fmt/core.h>

#include <utility>

#include "vfilter/syntax/frontend.hpp"

namespace vfilter
{

ParsedFilter::ParsedFilter(std::string text, std::string source_name)
: ctx_(std::make_unique<AstContext>()),
  source_(std::make_unique<SourceManager>(std::move(text), std::move(source_name)))
{
}

ParsedFilter parse(std::string_view text, const ParseOptions & options)
{
  ParsedFilter out{std::string(text), options.source_name};

  const ParseOutput parsed = parse_source(*out.source_, *out.ctx_, out.diags_, options.parser);
  out.root_ = parsed.root;

  if (out.root_ == nullptr) {
    const Diagnostic * first = out.diags_.first_error();
    if (first == nullptr) {
      out.error_ = FilterError(ErrorTag::SyntaxError, "failed to parse expression");
    } else {
      out.error_ = FilterError(ErrorTag::SyntaxError, first->message, first->range.get_begin());
    }
  }
  return out;
}

ParsedFilter parse_and_analyze(std::string_view text, const ParseOptions & options)
{
  ParsedFilter out = parse(text, options);
  if (!out.ok()) {
    return out;
  }

  if (auto err = analyze(out.root_)) {
    to_diagnostic(*err, out.diags_);
    out.error_ = std::move(err);
  }
  return out;
}

qdrant::TranslateResult to_filter(const Expr * expr)
{
  if (auto err = analyze(expr)) {
    return qdrant::TranslateResult{qdrant::Filter{}, std::move(err)};
  }
  return qdrant::translate(expr);
}

void to_diagnostic(const FilterError & err, DiagnosticBag & diags)
{
  const std::string code = fmt::format("E{:03}", static_cast<int>(err.tag) + 1);
  diags
    .error(
      SourceRange(err.position, err.position),
      fmt::format("{}: {}", to_string(err.tag), err.detail))
    .with_code(code);
}

}  // namespace vfilter
