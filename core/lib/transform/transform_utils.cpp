// reactc/transform/transform_utils.cpp - Helpers shared by the transformers
#include "reactc/transform/transform_utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>

#include "reactc/analysis/scope.hpp"
#include "reactc/syntax/token.hpp"

namespace reactc
{

void rewrite_reads(
  EditBuffer & buffer, const AstNode * body, const NameSet & names,
  const std::set<uint32_t> & skip)
{
  if (body == nullptr || names.empty()) {
    return;
  }
  for_each_free_reference(body, [&](const Identifier * id, const AstNode * parent) {
    if (names.count(id->name) == 0 || skip.count(id->start()) != 0) {
      return;
    }
    if (isa<ShorthandProperty>(parent)) {
      return;
    }
    if (ends_with(buffer.slice(id->get_range()), ".value")) {
      return;
    }
    buffer.append_left(id->end(), ".value");
  });
}

std::string quote_js(std::string_view text)
{
  return nlohmann::json(std::string(text))
    .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string property_key(std::string_view text)
{
  bool valid = !text.empty() && std::isdigit(static_cast<unsigned char>(text.front())) == 0;
  for (char c : text) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u) == 0 && c != '_' && c != '$' && u < 0x80) {
      valid = false;
    }
  }
  return valid ? std::string(text) : quote_js(text);
}

bool needs_parens_for_member(const Expr * expr) noexcept
{
  switch (expr->get_kind()) {
    case NodeKind::Identifier:
    case NodeKind::Member:
    case NodeKind::Index:
    case NodeKind::Call:
    case NodeKind::Paren:
    case NodeKind::This:
    case NodeKind::ArrayLiteral:
    case NodeKind::TemplateLiteral:
    case NodeKind::TaggedTemplate:
      return false;
    default:
      return true;
  }
}

std::string_view line_indent(std::string_view source, uint32_t pos) noexcept
{
  if (pos > source.size()) {
    return {};
  }
  size_t line_start = source.rfind('\n', pos == 0 ? 0 : pos - 1);
  line_start = line_start == std::string_view::npos ? 0 : line_start + 1;
  if (pos == 0) {
    line_start = 0;
  }
  size_t end = line_start;
  while (end < pos && (source[end] == ' ' || source[end] == '\t')) {
    ++end;
  }
  return source.substr(line_start, end - line_start);
}

}  // namespace reactc
