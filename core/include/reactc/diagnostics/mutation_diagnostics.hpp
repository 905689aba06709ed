// reactc/diagnostics/mutation_diagnostics.hpp - Mutations that cannot trigger updates
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/basic/diagnostic.hpp"

namespace reactc
{

/**
 * Reports `non-reactive-mutation` for every mutation site whose root is a
 * static binding that markup reads. Such a mutation changes the value but
 * never re-renders; redeclaring the binding with `let` makes it a signal.
 * The code is left unchanged.
 */
class MutationDiagnostics
{
public:
  void analyze(
    const ComponentInfo & component, const std::vector<VariableInfo> & variables,
    DiagnosticBag & diags) const;
};

}  // namespace reactc
