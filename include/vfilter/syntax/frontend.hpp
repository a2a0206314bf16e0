// vfilter/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include "vfilter/ast/ast.hpp"
#include "vfilter/ast/ast_context.hpp"
#include "vfilter/basic/diagnostic.hpp"
#include "vfilter/basic/source_manager.hpp"
#include "vfilter/syntax/parser.hpp"

namespace vfilter
{

struct ParseOutput
{
  Expr * root = nullptr;  ///< nullptr when a syntax error was reported
  size_t token_count = 0;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  const SourceManager & source, AstContext & ast, DiagnosticBag & diags,
  const syntax::ParserOptions & options = {});

}  // namespace vfilter
