// reactc/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "reactc/ast/ast.hpp"
#include "reactc/ast/ast_context.hpp"
#include "reactc/basic/diagnostic.hpp"
#include "reactc/basic/source_manager.hpp"

namespace reactc
{

/**
 * Everything produced by parsing one file.
 *
 * Nodes point into `source` and live in `ast`, so the unit is heap-allocated
 * and never moved once parsed.
 */
struct ParsedUnit
{
  SourceFile source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_slice(r);
  }
};

// Parse pipeline:
// source -> lexer (on-demand tokens) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  const std::filesystem::path & path, std::string source_text);

}  // namespace reactc
