// vfilter/syntax/frontend.cpp - High-level parse pipeline
#include "vfilter/syntax/frontend.hpp"

#include <utility>

#include "vfilter/syntax/lexer.hpp"

namespace vfilter
{

ParseOutput parse_source(
  const SourceManager & source, AstContext & ast, DiagnosticBag & diags,
  const syntax::ParserOptions & options)
{
  ParseOutput out;

  syntax::Lexer lexer(ast, source.get_text());
  std::vector<syntax::Token> tokens = lexer.lex_all();
  out.token_count = tokens.size();

  syntax::Parser parser(ast, diags, std::move(tokens), options);
  out.root = parser.parse();
  return out;
}

}  // namespace vfilter
