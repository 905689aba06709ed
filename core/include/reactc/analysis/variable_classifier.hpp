// reactc/analysis/variable_classifier.hpp - Reactivity classification of component bindings
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/analysis/signal_api_registry.hpp"
#include "reactc/ast/ast.hpp"

namespace reactc
{

/// One binding of a destructuring pattern the rewriters know how to expand.
struct PatternBinding
{
  std::string_view name;  ///< Local binding name
  std::string property;   ///< Key read from the source (`data` in `{ data: tasks }`) or index
  bool index_access = false;
  SourceRange range;      ///< The pattern element
};

/**
 * Bindings of an expandable pattern, in source order.
 *
 * Expandable means an object pattern of `a` / `key: a` elements or an array
 * pattern of plain names (holes allowed), with no defaults, nesting, rest
 * elements or computed keys. Anything else yields an empty vector.
 */
[[nodiscard]] std::vector<PatternBinding> expandable_bindings(const Pattern * pattern);

/// A declarator the rewriters may replace by one declaration per binding:
/// the only declarator of its statement, initialised, with an expandable pattern.
[[nodiscard]] bool is_expandable_declaration(const VarStmt & stmt, const VarDeclarator & decl);

/**
 * Variable Classifier.
 *
 * Single forward pass over the top-level declarations of a component body:
 * - `let` / `var` bindings are signals (`let` destructuring goes through a
 *   synthetic `__let_<n>` binding);
 * - a `const` initialised by a registered signal API stays static and keeps
 *   the API's property sets; destructuring it introduces `__<api>_<n>`;
 * - any other `const` is computed when its initializer reads a reactive
 *   binding seen so far, else static.
 * Nested closures are not inspected for declarations.
 */
class VariableClassifier
{
public:
  explicit VariableClassifier(const RuntimeImports & imports) : imports_(imports) {}

  [[nodiscard]] std::vector<VariableInfo> classify(const ComponentInfo & component) const;

private:
  const RuntimeImports & imports_;
};

/// Lookup helper over a classification result.
[[nodiscard]] const VariableInfo * find_variable(
  const std::vector<VariableInfo> & variables, std::string_view name) noexcept;

/// Names of all bindings of the given kind.
[[nodiscard]] NameSet names_of_kind(
  const std::vector<VariableInfo> & variables, ReactivityKind kind);

}  // namespace reactc
