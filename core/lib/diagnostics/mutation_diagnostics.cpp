// reactc/diagnostics/mutation_diagnostics.cpp - Mutations that cannot trigger updates
#include "reactc/diagnostics/mutation_diagnostics.hpp"

#include <fmt/format.h>

#include "reactc/analysis/mutation_detector.hpp"
#include "reactc/analysis/scope.hpp"
#include "reactc/analysis/variable_classifier.hpp"

namespace reactc
{

void MutationDiagnostics::analyze(
  const ComponentInfo & component, const std::vector<VariableInfo> & variables,
  DiagnosticBag & diags) const
{
  const NameSet markup = collect_markup_references(component);
  NameSet roots;
  for (const auto & v : variables) {
    if (
      v.kind == ReactivityKind::Static && !v.is_synthetic && !v.has_api_properties() &&
      !v.is_reactive_source && markup.count(v.name) != 0) {
      roots.insert(v.name);
    }
  }

  for (const auto & site : MutationDetector::find_sites(component, roots)) {
    const VariableInfo * declared = find_variable(variables, site.root);
    DiagnosticBuilder builder = diags.report_warning(
      site.range,
      fmt::format(
        "Mutation of `{}` will not update the UI: it is a static binding read in markup",
        site.root),
      fmt::format("{} of a non-reactive binding", to_string(site.kind)));
    builder.with_code(diag_codes::k_non_reactive_mutation)
      .with_fix(fmt::format(
        "Declare `{0}` with `let` instead of `const` so `{0}` becomes a signal and this "
        "mutation notifies the markup",
        site.root));
    if (declared != nullptr) {
      builder.with_note(declared->range, "declared here");
    }
  }
}

}  // namespace reactc
