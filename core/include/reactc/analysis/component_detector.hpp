// reactc/analysis/component_detector.hpp - Finds component functions in a module
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/ast/ast.hpp"

namespace reactc
{

/**
 * Component boundary detection.
 *
 * A component is a module-level function (declaration, `export`ed
 * declaration, or `const`/`let` bound function/arrow expression) whose own
 * body returns JSX. Returns inside nested functions do not count. Functions
 * that never return JSX are not reported.
 */
class ComponentDetector
{
public:
  [[nodiscard]] std::vector<ComponentInfo> detect(const Program & program) const;

  /// True if expr is JSX, possibly parenthesized or behind ?: / && / || / ??.
  [[nodiscard]] static bool is_jsx_expression(const Expr * expr) noexcept;

  /// True if the function's own body returns JSX.
  [[nodiscard]] static bool returns_jsx(const FunctionData & fn);

private:
  void consider(
    const AstNode * node, const FunctionData & fn, std::string_view name, SourceRange name_range,
    std::vector<ComponentInfo> & out) const;
  void consider_var_stmt(const VarStmt & stmt, std::vector<ComponentInfo> & out) const;
};

}  // namespace reactc
