// reactc/analysis/jsx_analyzer.hpp - Reactivity of markup expressions
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"

namespace reactc
{

/**
 * JSX Analyzer.
 *
 * Marks a `{...}` container reactive when, anywhere inside it (nested JSX
 * included), it reads:
 * - a signal or computed binding;
 * - a signal property of a signal-API binding (`tasks.loading`);
 * - a field signal of a signal-API binding (`form.title.error`);
 * - a reactive-source binding.
 * Shadowed names never count.
 */
class JsxAnalyzer
{
public:
  /// One entry per expression container of the body, in source order.
  [[nodiscard]] std::vector<JsxExpressionInfo> analyze(
    const ComponentInfo & component, const std::vector<VariableInfo> & variables) const;
};

}  // namespace reactc
