// reactc/diagnostics/props_destructuring.cpp - Destructured component parameters
#include "reactc/diagnostics/props_destructuring.hpp"

#include <fmt/format.h>

namespace reactc
{

void PropsDestructuringCheck::analyze(
  const std::vector<ComponentInfo> & components, DiagnosticBag & diags) const
{
  for (const auto & component : components) {
    if (!component.params.has_destructured_props) {
      continue;
    }
    diags
      .report_warning(
        component.params.first_param,
        fmt::format(
          "Component `{}` destructures its props; destructured values are read once and "
          "do not update",
          component.name),
        "props destructured here")
      .with_code(diag_codes::k_props_destructuring)
      .with_fix("Accept a single `props` parameter and read values as `props.name` where "
                "they are used");
  }
}

}  // namespace reactc
