// reactc/transform/transform_utils.hpp - Helpers shared by the transformers
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/ast/ast.hpp"
#include "reactc/transform/edit_buffer.hpp"

namespace reactc
{

/// Runtime helpers referenced by generated code, grouped by the module
/// they are imported from.
struct HelperUsage
{
  NameSet runtime;    ///< signal, computed
  NameSet internals;  ///< __element, __append, ...

  [[nodiscard]] bool empty() const noexcept { return runtime.empty() && internals.empty(); }
};

/**
 * Append `.value` after every free read of a name in `names` under `body`.
 *
 * Skipped: reads whose start offset is in `skip`, shorthand object
 * properties, and reads whose current buffer text already ends in
 * `.value`. A source-level `x.value` or `x.peek()` is a property of the
 * unwrapped value and is rewritten like any other read.
 */
void rewrite_reads(
  EditBuffer & buffer, const AstNode * body, const NameSet & names,
  const std::set<uint32_t> & skip = {});

/// JavaScript string literal for `text` (double quotes, JSON escaping).
[[nodiscard]] std::string quote_js(std::string_view text);

/// `text` when it is a valid identifier, else a quoted property key.
[[nodiscard]] std::string property_key(std::string_view text);

/// True when `expr` must be parenthesized before a `.prop` suffix.
[[nodiscard]] bool needs_parens_for_member(const Expr * expr) noexcept;

/// Leading whitespace of the line containing `pos`.
[[nodiscard]] std::string_view line_indent(std::string_view source, uint32_t pos) noexcept;

[[nodiscard]] inline bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

}  // namespace reactc
