// reactc/syntax/frontend.cpp - High-level parse pipeline
#include "reactc/syntax/frontend.hpp"

#include <utility>

#include "reactc/syntax/parser.hpp"

namespace reactc
{

std::unique_ptr<ParsedUnit> parse_source(
  const std::filesystem::path & path, std::string source_text)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceFile(path, std::move(source_text));
  unit->diags.attach_source(&unit->source);

  syntax::Parser parser(unit->ast, unit->source, unit->diags);
  unit->program = parser.parse_program();
  return unit;
}

}  // namespace reactc
