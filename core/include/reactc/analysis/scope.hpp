// reactc/analysis/scope.hpp - Lexical scoping helpers over component bodies
//
// Analyses only care about the names declared at the top level of a
// component body. Anything declared deeper (function parameters, block-level
// let/const, catch parameters, for-loop heads) shadows those names for the
// subtree it covers; ScopeWalker tracks that while walking.
//
#pragma once

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/ast/ast.hpp"

namespace reactc
{

/// Append every name bound by `pattern` (in source order) to `out`.
void collect_binding_names(const Pattern * pattern, std::vector<std::string_view> & out);

/// Follow member and index objects down to the root identifier
/// (`a` in `a.b[c].d`). Returns nullptr for any other root.
[[nodiscard]] const Identifier * root_identifier(const Expr * expr) noexcept;

// ============================================================================
// ScopeWalker
// ============================================================================

/**
 * Pre-order walk that knows which names are shadowed at each node.
 *
 * A root block never opens a scope, so walking a component body treats the
 * body's own declarations as the names being tracked rather than as
 * shadowing ones. A root function still binds its parameters.
 */
class ScopeWalker
{
public:
  /// Return false to skip the node's children.
  using VisitFn =
    std::function<bool(const AstNode * node, const AstNode * parent, const ScopeWalker & scopes)>;

  explicit ScopeWalker(VisitFn fn) : fn_(std::move(fn)) {}

  void walk(const AstNode * root);

  /// True when a scope opened below the root declares `name`.
  [[nodiscard]] bool is_shadowed(std::string_view name) const noexcept;

private:
  void visit(const AstNode * node, const AstNode * parent);
  bool open_scope(const AstNode * node);

  VisitFn fn_;
  const AstNode * root_ = nullptr;
  std::vector<std::vector<std::string_view>> scopes_;
};

using ReferenceFn = std::function<void(const Identifier * id, const AstNode * parent)>;

/// Invoke fn for every Identifier under root that is not bound by a
/// declaration nested inside root.
void for_each_free_reference(const AstNode * root, const ReferenceFn & fn);

/// True if any free reference under root names a member of `names`.
[[nodiscard]] bool references_any(const AstNode * root, const NameSet & names);

/// Names read inside JSX expression containers and spread attributes of a
/// component body, with shadowing applied.
[[nodiscard]] NameSet collect_markup_references(const ComponentInfo & component);

}  // namespace reactc
