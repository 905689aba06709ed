// reactc/analysis/reactivity_types.hpp - Fact tables shared by analyses and transforms
//
// ComponentInfo borrows AST nodes and is only valid while its ParsedUnit is
// alive. VariableInfo, MutationInfo and JsxExpressionInfo are plain data and
// may outlive the parse (the driver returns them in CompileOutput).
//
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "reactc/ast/ast.hpp"
#include "reactc/basic/source_manager.hpp"

namespace reactc
{

/// Ordered so JSON dumps and generated code are deterministic.
using NameSet = std::set<std::string, std::less<>>;

// ============================================================================
// Reactivity Kind
// ============================================================================

enum class ReactivityKind : uint8_t {
  Static,    ///< Plain value, never rewritten
  Signal,    ///< Mutable reactive container (`let`/`var`)
  Computed,  ///< Memoized derivation of signals or computeds
};

[[nodiscard]] constexpr std::string_view to_string(ReactivityKind k) noexcept
{
  switch (k) {
    case ReactivityKind::Static:
      return "static";
    case ReactivityKind::Signal:
      return "signal";
    case ReactivityKind::Computed:
      return "computed";
  }
  return "static";
}

// ============================================================================
// ComponentInfo
// ============================================================================

struct ComponentParams
{
  size_t count = 0;
  bool has_destructured_props = false;  ///< First parameter is an object pattern
  SourceRange first_param;              ///< Invalid when there are no parameters
};

/**
 * A detected component: a module-level function whose own body returns JSX.
 */
struct ComponentInfo
{
  std::string name;
  SourceRange name_range;
  ComponentParams params;

  /// Executable body: the block including braces, or the expression body.
  SourceRange body;

  const FunctionData * fn = nullptr;
  const AstNode * node = nullptr;  ///< FunctionDecl, FunctionExpr or ArrowFunctionExpr

  [[nodiscard]] const BlockStmt * block_body() const noexcept
  {
    return fn != nullptr ? fn->block_body() : nullptr;
  }
  [[nodiscard]] const AstNode * body_node() const noexcept
  {
    return fn != nullptr ? fn->body : nullptr;
  }
};

// ============================================================================
// VariableInfo
// ============================================================================

/**
 * One top-level binding of a component body.
 *
 * Destructured bindings record where they were extracted from:
 * `destructured_from` names a synthetic binding (`__query_0`, `__let_0`) in
 * the same list, and `property_name` is the key read from the source object
 * (`data` in `{ data: tasks }`), or the element index for array patterns.
 */
struct VariableInfo
{
  std::string name;
  ReactivityKind kind = ReactivityKind::Static;
  SourceRange range;
  VarKind declared_with = VarKind::Const;

  std::optional<std::string> destructured_from;
  std::optional<std::string> property_name;
  bool index_access = false;  ///< property_name is an array index

  /// Property sets of a signal-API result (plain or synthetic binding).
  NameSet signal_properties;
  NameSet plain_properties;
  NameSet field_signal_properties;

  bool is_synthetic = false;
  bool is_reactive_source = false;

  [[nodiscard]] bool is_reactive() const noexcept { return kind != ReactivityKind::Static; }
  [[nodiscard]] bool has_api_properties() const noexcept
  {
    return !signal_properties.empty() || !plain_properties.empty() ||
           !field_signal_properties.empty();
  }
};

// ============================================================================
// MutationInfo
// ============================================================================

enum class MutationKind : uint8_t {
  MethodCall,      ///< items.push(x)
  PropertyAssign,  ///< state.count = 1
  IndexAssign,     ///< items[0] = x
  Delete,          ///< delete state.key
  BulkAssign,      ///< Object.assign(state, patch)
};

[[nodiscard]] constexpr std::string_view to_string(MutationKind k) noexcept
{
  switch (k) {
    case MutationKind::MethodCall:
      return "method-call";
    case MutationKind::PropertyAssign:
      return "property-assign";
    case MutationKind::IndexAssign:
      return "index-assign";
    case MutationKind::Delete:
      return "delete";
    case MutationKind::BulkAssign:
      return "bulk-assign";
  }
  return "method-call";
}

struct MutationInfo
{
  MutationKind kind = MutationKind::MethodCall;
  std::string root;        ///< Binding the mutation ultimately targets
  SourceRange range;       ///< Whole mutating expression
  SourceRange root_range;  ///< The root identifier inside the site
  std::string method;      ///< Method name for MethodCall, else empty
  bool value_used = false;  ///< The enclosing expression reads the site's result
};

// ============================================================================
// JsxExpressionInfo
// ============================================================================

/// A `{...}` container inside markup and whether it reads reactive state.
struct JsxExpressionInfo
{
  SourceRange range;  ///< Includes the braces
  bool reactive = false;
  std::vector<std::string> dependencies;  ///< Reactive names read, in first-use order
};

}  // namespace reactc
