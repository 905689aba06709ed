// reactc/diagnostics/props_destructuring.hpp - Destructured component parameters
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/basic/diagnostic.hpp"

namespace reactc
{

/// Reports `props-destructuring` for every component whose first parameter
/// is an object pattern: destructuring reads each prop once, at call time,
/// and defeats the lazy getters reactive props are passed as.
class PropsDestructuringCheck
{
public:
  void analyze(const std::vector<ComponentInfo> & components, DiagnosticBag & diags) const;
};

}  // namespace reactc
