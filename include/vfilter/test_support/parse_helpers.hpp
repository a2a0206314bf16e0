// vfilter/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-expression parsing pipeline that keeps the context, source and
// diagnostics alive next to the parsed root.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/diagnostic.hpp"
#include "vfilter/basic/source_manager.hpp"
#include "vfilter/syntax/frontend.hpp"

namespace vfilter::test_support
{

struct TestParseUnit
{
  std::unique_ptr<SourceManager> source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Expr * root = nullptr;

  [[nodiscard]] bool ok() const noexcept { return root != nullptr && !diags.has_errors(); }

  /// Message of the first error, or "" when there is none.
  [[nodiscard]] std::string first_error() const
  {
    const Diagnostic * d = diags.first_error();
    return d == nullptr ? std::string() : d->message;
  }
};

[[nodiscard]] inline TestParseUnit parse(std::string src, syntax::ParserOptions options = {})
{
  TestParseUnit out;
  out.source = std::make_unique<SourceManager>(std::move(src), "<test>");
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed = parse_source(*out.source, *out.ast, out.diags, options);
  out.root = parsed.root;
  return out;
}

}  // namespace vfilter::test_support
